#pragma once

#include "anchorpatch/application/config.hpp"
#include "anchorpatch/core/document.hpp"
#include "anchorpatch/core/report.hpp"
#include "anchorpatch/interfaces.hpp"
#include <memory>
#include <optional>
#include <string>

namespace anchorpatch {

// One patching session: target -> patch -> engine -> report -> confirm -> write
class PatchApp {
private:
    std::unique_ptr<ITerminal> terminal_;
    std::unique_ptr<IFileSystem> filesystem_;
    std::unique_ptr<IPatchParser> parser_;
    std::unique_ptr<IRunLog> log_;

public:
    PatchApp(std::unique_ptr<ITerminal> terminal,
             std::unique_ptr<IFileSystem> filesystem,
             std::unique_ptr<IPatchParser> parser,
             std::unique_ptr<IRunLog> log);

    // Exit status: 0 success (including skipped hunks and declined writes), 1 failure
    auto run(const Config& config) -> int;

private:
    auto run_session(const Config& config) -> int;
    auto is_batch(const Config& config) -> bool;

    auto resolve_target(const Config& config) -> std::optional<std::string>;
    auto load_patch_text(const Config& config, const std::string& target)
        -> std::optional<std::string>;
    auto log_report(const PatchReport& report) -> void;
    auto maybe_fix_indentation(const Config& config, const std::string& target,
                               Document document) -> Document;
    auto confirm_write(const Config& config, const std::string& target) -> bool;
    auto save(const Config& config, const Document& document, const std::string& target) -> int;

    auto fail(const std::string& message) -> int;
};

} // namespace anchorpatch
