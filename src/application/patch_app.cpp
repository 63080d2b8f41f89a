#include "anchorpatch/application/patch_app.hpp"
#include "anchorpatch/core/disambiguation.hpp"
#include "anchorpatch/core/indentation.hpp"
#include "anchorpatch/core/patch_engine.hpp"
#include "anchorpatch/parsers/patch_parser.hpp"
#include <filesystem>
#include <iostream>
#include <sstream>

namespace anchorpatch {

namespace {

// Forwards to the real resolver and records every decision in the run log
class LoggingDisambiguator : public IDisambiguator {
public:
    LoggingDisambiguator(IDisambiguator& inner, IRunLog& log) : inner_(inner), log_(log) {}

    auto resolve(const DisambiguationRequest& request) -> Choice override {
        auto choice = inner_.resolve(request);

        std::ostringstream details;
        for (size_t i = 0; i < request.candidates.size(); ++i) {
            details << "Candidate " << i + 1 << ": line " << request.candidates[i].start + 1 << "\n";
        }
        details << "Choice: " << choice_display_name(choice);

        log_.log_event("DISAMBIGUATION",
                       "Hunk #" + std::to_string(request.hunk_number) + ": "
                           + std::to_string(request.candidates.size()) + " candidates",
                       details.str());
        return choice;
    }

private:
    IDisambiguator& inner_;
    IRunLog& log_;
};

auto describe_document(const Document& document) -> std::string {
    std::string details = std::to_string(document.lines.size()) + " lines, ";
    details += document.line_ending == LineEnding::CRLF ? "CRLF" : "LF";
    if (!document.final_newline) {
        details += ", no final newline";
    }
    return details;
}

} // namespace

PatchApp::PatchApp(std::unique_ptr<ITerminal> terminal, std::unique_ptr<IFileSystem> filesystem,
                   std::unique_ptr<IPatchParser> parser, std::unique_ptr<IRunLog> log)
    : terminal_(std::move(terminal)), filesystem_(std::move(filesystem)),
      parser_(std::move(parser)), log_(std::move(log)) {}

auto PatchApp::run(const Config& config) -> int {
    try {
        return run_session(config);
    } catch (const std::exception& e) {
        return fail(std::string("unexpected error: ") + e.what());
    }
}

auto PatchApp::run_session(const Config& config) -> int {
    auto target = resolve_target(config);
    if (!target) {
        return fail("no target file given");
    }

    auto document = filesystem_->read_document(*target);
    if (!document) {
        return fail("cannot read target file " + *target);
    }
    log_->log_event("FILE_READ", *target, describe_document(*document));

    auto patch_text = load_patch_text(config, *target);
    if (!patch_text) {
        if (config.patch_file.empty()) {
            return fail("no patch to apply");
        }
        return fail("cannot read patch from "
                    + (config.patch_file == "-" ? std::string("stdin") : config.patch_file));
    }

    // Batch runs answer ambiguity from the configured policy
    ScriptedDisambiguator policy_resolver(config.ambiguity);
    IDisambiguator& resolver = is_batch(config) ? static_cast<IDisambiguator&>(policy_resolver)
                                                : static_cast<IDisambiguator&>(*terminal_);
    LoggingDisambiguator logging_resolver(resolver, *log_);

    PatchEngine engine(*parser_, logging_resolver,
                       EngineOptions{.revert = config.revert, .context_lines = config.context_lines});
    auto result = engine.run(*patch_text, *document);

    log_report(result.report);
    terminal_->show_report(result.report);

    if (is_failure(result.report.status)) {
        return fail(status_display_name(result.report.status));
    }
    if (!result.report.changed_document()) {
        terminal_->show_message("No hunk changed the file; nothing to write.");
        log_->log_event("CHANGES_DISCARDED", "no changes", "");
        return 0;
    }

    auto patched = maybe_fix_indentation(config, *target, std::move(result.document));

    if (config.dry_run) {
        terminal_->show_message("Dry run - " + *target + " not modified.");
        log_->log_event("CHANGES_DISCARDED", "dry run", "");
        return 0;
    }
    if (!confirm_write(config, *target)) {
        terminal_->show_message("Changes discarded.");
        log_->log_event("CHANGES_DISCARDED", "not confirmed", "");
        return 0;
    }

    return save(config, patched, *target);
}

auto PatchApp::is_batch(const Config& config) -> bool {
    return !config.interactive || !terminal_->is_interactive();
}

auto PatchApp::resolve_target(const Config& config) -> std::optional<std::string> {
    if (!config.target_file.empty()) {
        return config.target_file;
    }
    if (is_batch(config)) {
        return std::nullopt;
    }

    auto answer = terminal_->prompt_line("Target file:");
    if (rtrim(answer).empty()) {
        return std::nullopt;
    }
    return rtrim(answer);
}

auto PatchApp::load_patch_text(const Config& config, const std::string& target)
    -> std::optional<std::string> {
    std::optional<std::string> text;
    std::string source;

    if (config.patch_file == "-") {
        source = "stdin";
        text = filesystem_->read_text("/dev/stdin");
    } else if (!config.patch_file.empty()) {
        source = config.patch_file;
        text = filesystem_->read_text(config.patch_file);
    } else if (!is_batch(config)) {
        auto directory = std::filesystem::path(target).parent_path().string();
        auto candidates = filesystem_->list_patch_files(directory);

        std::optional<size_t> chosen;
        if (!candidates.empty()) {
            chosen = terminal_->choose_patch_file(candidates);
        }
        if (chosen && *chosen < candidates.size()) {
            source = candidates[*chosen];
            text = filesystem_->read_text(source);
        } else {
            source = "pasted text";
            text = terminal_->read_patch_text();
        }
    }

    if (text) {
        log_->log_event("PATCH_READ", source, std::to_string(text->size()) + " bytes");
    }
    return text;
}

auto PatchApp::log_report(const PatchReport& report) -> void {
    size_t parse_errors = report.count(HunkOutcome::PARSE_ERROR);
    log_->log_event("PATCH_PARSED",
                    std::to_string(report.hunks.size()) + " hunk blocks",
                    std::to_string(report.hunks.size() - parse_errors) + " valid, "
                        + std::to_string(parse_errors) + " parse errors");

    for (const auto& hunk : report.hunks) {
        log_->log_event(outcome_event_type(hunk.outcome), "Hunk #" + std::to_string(hunk.number),
                        format_hunk_details(hunk));
    }

    log_->log_event("PATCH_SUMMARY", status_display_name(report.status), format_summary(report));
}

auto PatchApp::maybe_fix_indentation(const Config& config, const std::string& target,
                                     Document document) -> Document {
    if (!config.fix_indentation || !is_python_source(target, document)) {
        return document;
    }

    auto analysis = analyze_indentation(document);
    if (!analysis.needs_fix()) {
        return document;
    }

    auto description = describe_analysis(analysis);
    terminal_->show_message("Python indentation problems detected:\n" + description);

    bool accepted = is_batch(config) ? config.assume_yes
                                     : terminal_->confirm("Normalise indentation?");
    if (!accepted) {
        return document;
    }

    auto fixed = normalize_indentation(document, config.indentation);
    log_->log_event("INDENTATION_CORRECTED", target, description);
    return fixed;
}

auto PatchApp::confirm_write(const Config& config, const std::string& target) -> bool {
    if (config.assume_yes) {
        return true;
    }
    if (is_batch(config)) {
        terminal_->show_message("Non-interactive run without --yes; not writing.");
        return false;
    }
    return terminal_->confirm("Write changes to " + target + "?");
}

auto PatchApp::save(const Config& config, const Document& document, const std::string& target)
    -> int {
    if (config.create_backup) {
        auto backup = filesystem_->create_backup(target);
        if (!backup) {
            return fail("cannot create backup of " + target + "; file left unchanged");
        }
        log_->log_event("BACKUP_CREATED", *backup, "");
        terminal_->show_message("Backup: " + *backup);
    }

    if (!filesystem_->write_document(document, target)) {
        return fail("cannot write " + target);
    }

    log_->log_event("FILE_SAVED", target, describe_document(document));
    terminal_->show_message("Saved " + target);
    return 0;
}

auto PatchApp::fail(const std::string& message) -> int {
    std::cerr << "Error: " << message << "\n";
    log_->log_event("ERROR", message, "");
    return 1;
}

} // namespace anchorpatch
