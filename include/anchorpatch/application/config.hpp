#pragma once

#include "anchorpatch/core/disambiguation.hpp"
#include "anchorpatch/core/indentation.hpp"
#include <optional>
#include <string>
#include <vector>

namespace anchorpatch {

struct Config {
    std::string target_file;                 // Prompted for when empty
    std::string patch_file;                  // "-" reads stdin; empty means ask
    size_t context_lines = 3;
    bool revert = false;
    bool dry_run = false;
    bool assume_yes = false;
    bool interactive = true;
    AmbiguityPolicy ambiguity = AmbiguityPolicy::SKIP;
    bool create_backup = true;
    bool fix_indentation = true;
    IndentationStyle indentation;
    std::string log_file;                    // Empty means default_log_path()
    bool log_enabled = true;
    bool plain_terminal = false;
};

struct ParseArgsResult {
    std::optional<Config> config;
    std::string error;
    bool show_help = false;
};

// Arguments without the program name
auto parse_arguments(const std::vector<std::string>& args) -> ParseArgsResult;

auto usage_text() -> std::string;

} // namespace anchorpatch
