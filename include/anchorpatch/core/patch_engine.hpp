#pragma once

#include "anchorpatch/core/disambiguation.hpp"
#include "anchorpatch/core/document.hpp"
#include "anchorpatch/core/report.hpp"
#include "anchorpatch/interfaces.hpp"
#include "anchorpatch/parsers/patch_parser.hpp"
#include <cstddef>
#include <string>

namespace anchorpatch {

struct EngineOptions {
    bool revert = false;        // Swap Add/Remove roles before locating
    size_t context_lines = 3;   // Window shown per candidate when disambiguating
};

struct RunResult {
    Document document;
    PatchReport report;
};

// Drives classify -> parse -> locate -> apply over a patch, in patch order
class PatchEngine {
public:
    PatchEngine(IPatchParser& parser, IDisambiguator& disambiguator, EngineOptions options = {});

    // Never throws; every block's fate is in the report
    auto run(const std::string& patch_text, Document document) -> RunResult;

private:
    // Per-run state, threaded explicitly through each hunk
    struct RunState {
        Document document;
        std::ptrdiff_t offset{};   // Cumulative delta of applied hunks
        bool cancelled = false;
        bool any_applied = false;
    };

    auto process_hunk(const Hunk& parsed, RunState& state, HunkReport& entry) -> void;
    auto locate(const Hunk& hunk, RunState& state, HunkReport& entry) -> std::optional<size_t>;
    auto choose_candidate(const Hunk& hunk, const std::vector<MatchCandidate>& candidates,
                          RunState& state, HunkReport& entry) -> std::optional<size_t>;

    IPatchParser& parser_;
    IDisambiguator& disambiguator_;
    EngineOptions options_;
};

} // namespace anchorpatch
