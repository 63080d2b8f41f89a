#pragma once

#include "anchorpatch/core/hunk.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace anchorpatch {

// Final fate of one hunk block
enum class HunkOutcome {
    APPLIED,              // Applied cleanly
    WARNED,               // Applied, but context or header counts disagreed
    SKIPPED_NO_MATCH,     // Anchor not found, or span outside the document
    SKIPPED_AMBIGUOUS,    // Several candidates and the resolver skipped or cancelled
    PARSE_ERROR,          // Block dropped by the parser
    NOT_ATTEMPTED         // Run was cancelled before this hunk
};

// Half-open, 0-based range of document lines
struct LineRange {
    size_t begin{};
    size_t end{};

    auto operator==(const LineRange& other) const -> bool = default;
};

struct HunkReport {
    size_t number{};                       // 1-based position in the patch
    size_t patch_line{};
    std::string header_line;
    std::optional<HunkKind> kind;          // Absent for parse errors
    std::optional<size_t> resolved_line;   // 0-based start the hunk was applied at
    std::optional<LineRange> applied_range;
    HunkOutcome outcome = HunkOutcome::NOT_ATTEMPTED;
    std::ptrdiff_t delta{};
    std::vector<std::string> warnings;
    std::vector<std::string> notes;        // Informational: disambiguation choice, fallbacks
};

enum class RunStatus {
    COMPLETED,
    CANCELLED,                 // Cancelled after at least one hunk changed the document
    NO_VALID_HUNKS,            // Nothing parseable in the patch
    CANCELLED_BEFORE_CHANGES   // Cancelled before any hunk applied
};

struct PatchReport {
    std::vector<HunkReport> hunks;
    RunStatus status = RunStatus::COMPLETED;

    auto count(HunkOutcome outcome) const -> size_t;
    auto changed_document() const -> bool;
};

auto is_failure(RunStatus status) -> bool;
auto outcome_display_name(HunkOutcome outcome) -> std::string;
auto status_display_name(RunStatus status) -> std::string;

// Run log event type for an outcome (HUNK_APPLIED, HUNK_SKIPPED, ...)
auto outcome_event_type(HunkOutcome outcome) -> std::string;

// Multi-line description of a hunk's fate, for logs and summaries
auto format_hunk_details(const HunkReport& hunk) -> std::string;
auto format_summary(const PatchReport& report) -> std::string;

} // namespace anchorpatch
