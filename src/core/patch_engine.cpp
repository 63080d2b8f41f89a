#include "anchorpatch/core/patch_engine.hpp"
#include "anchorpatch/core/anchor_locator.hpp"
#include "anchorpatch/core/hunk_applier.hpp"
#include <exception>

namespace anchorpatch {

PatchEngine::PatchEngine(IPatchParser& parser, IDisambiguator& disambiguator,
                         EngineOptions options)
    : parser_(parser), disambiguator_(disambiguator), options_(options) {}

auto PatchEngine::run(const std::string& patch_text, Document document) -> RunResult {
    RunState state{.document = std::move(document)};
    PatchReport report;

    ParsedPatch patch;
    try {
        patch = parser_.parse_patch(patch_text);
    } catch (const std::exception&) {
        report.status = RunStatus::NO_VALID_HUNKS;
        return RunResult{.document = std::move(state.document), .report = std::move(report)};
    }

    for (size_t i = 0; i < patch.blocks.size(); ++i) {
        const auto& block = patch.blocks[i];
        HunkReport entry{
            .number = i + 1, .patch_line = block.patch_line, .header_line = block.header_line};

        if (!block.hunk) {
            entry.outcome = HunkOutcome::PARSE_ERROR;
            entry.warnings.push_back(block.error);
        } else if (state.cancelled) {
            entry.kind = hunk_kind(*block.hunk);
            entry.outcome = HunkOutcome::NOT_ATTEMPTED;
        } else {
            try {
                process_hunk(*block.hunk, state, entry);
            } catch (const std::exception& e) {
                entry.outcome = HunkOutcome::SKIPPED_NO_MATCH;
                entry.applied_range.reset();
                entry.warnings.push_back(std::string("unexpected error: ") + e.what());
            }
        }

        report.hunks.push_back(std::move(entry));
    }

    if (patch.valid_hunk_count() == 0) {
        report.status = RunStatus::NO_VALID_HUNKS;
    } else if (state.cancelled) {
        report.status =
            state.any_applied ? RunStatus::CANCELLED : RunStatus::CANCELLED_BEFORE_CHANGES;
    } else {
        report.status = RunStatus::COMPLETED;
    }

    return RunResult{.document = std::move(state.document), .report = std::move(report)};
}

auto PatchEngine::process_hunk(const Hunk& parsed, RunState& state, HunkReport& entry) -> void {
    Hunk hunk = options_.revert ? swap_roles(parsed) : parsed;
    entry.kind = hunk_kind(hunk);

    auto start = locate(hunk, state, entry);
    if (!start) {
        return;
    }
    entry.resolved_line = *start;

    auto result = apply_hunk(state.document, hunk, *start);
    entry.outcome = result.outcome;
    entry.warnings.insert(entry.warnings.end(), result.warnings.begin(), result.warnings.end());

    if (result.outcome == HunkOutcome::APPLIED || result.outcome == HunkOutcome::WARNED) {
        entry.applied_range = result.range;
        entry.delta = result.delta;
        state.offset += result.delta;
        state.any_applied = true;
    }
}

auto PatchEngine::locate(const Hunk& hunk, RunState& state, HunkReport& entry)
    -> std::optional<size_t> {
    if (const auto* classic = std::get_if<ClassicHeader>(&hunk.header)) {
        auto start = resolve_classic_start(state.document, hunk, state.offset);
        if (!start) {
            entry.outcome = HunkOutcome::SKIPPED_NO_MATCH;
            entry.warnings.push_back("header position lies before the start of the document");
            return std::nullopt;
        }
        auto primary = classic_line_index(classic->new_start, classic->new_count, state.offset);
        if (primary && *primary != *start) {
            entry.notes.push_back("located by old-start position (line "
                                  + std::to_string(*start + 1) + ")");
        }
        return start;
    }

    auto anchor = anchor_lines(hunk);
    if (anchor.empty()) {
        entry.outcome = HunkOutcome::SKIPPED_NO_MATCH;
        entry.warnings.push_back("hunk has no anchor lines to search for");
        return std::nullopt;
    }

    auto candidates = locate_anchor(state.document, hunk);
    if (candidates.empty()) {
        entry.outcome = HunkOutcome::SKIPPED_NO_MATCH;
        entry.warnings.push_back("anchor not found: " + quote_line(anchor.front()));
        return std::nullopt;
    }

    if (candidates.size() == 1) {
        return anchored_start(hunk, candidates.front());
    }

    auto chosen = choose_candidate(hunk, candidates, state, entry);
    if (!chosen) {
        return std::nullopt;
    }
    return anchored_start(hunk, candidates[*chosen]);
}

auto PatchEngine::choose_candidate(const Hunk& hunk, const std::vector<MatchCandidate>& candidates,
                                   RunState& state, HunkReport& entry) -> std::optional<size_t> {
    auto request = build_disambiguation_request(state.document, hunk, entry.number, candidates,
                                                options_.context_lines);
    auto choice = disambiguator_.resolve(request);
    auto count = std::to_string(candidates.size());

    switch (choice.action) {
    case ChoiceAction::SELECT:
        if (choice.index < candidates.size()) {
            entry.notes.push_back("chose candidate " + std::to_string(choice.index + 1) + " of "
                                  + count + " (line "
                                  + std::to_string(candidates[choice.index].start + 1) + ")");
            return choice.index;
        }
        entry.outcome = HunkOutcome::SKIPPED_AMBIGUOUS;
        entry.warnings.push_back("invalid choice: candidate " + std::to_string(choice.index + 1)
                                 + " of " + count);
        return std::nullopt;
    case ChoiceAction::SKIP:
        entry.outcome = HunkOutcome::SKIPPED_AMBIGUOUS;
        entry.warnings.push_back("anchor matched " + count + " places; skipped");
        return std::nullopt;
    case ChoiceAction::CANCEL:
        entry.outcome = HunkOutcome::SKIPPED_AMBIGUOUS;
        entry.warnings.push_back("anchor matched " + count + " places; run cancelled");
        state.cancelled = true;
        return std::nullopt;
    }
    return std::nullopt;
}

} // namespace anchorpatch
