#include "anchorpatch/core/report.hpp"
#include <algorithm>
#include <iomanip>
#include <sstream>

namespace anchorpatch {

auto PatchReport::count(HunkOutcome outcome) const -> size_t {
    return static_cast<size_t>(std::count_if(hunks.begin(), hunks.end(),
                                             [outcome](const HunkReport& hunk) {
                                                 return hunk.outcome == outcome;
                                             }));
}

auto PatchReport::changed_document() const -> bool {
    return count(HunkOutcome::APPLIED) + count(HunkOutcome::WARNED) > 0;
}

auto is_failure(RunStatus status) -> bool {
    return status == RunStatus::NO_VALID_HUNKS || status == RunStatus::CANCELLED_BEFORE_CHANGES;
}

auto outcome_display_name(HunkOutcome outcome) -> std::string {
    switch (outcome) {
    case HunkOutcome::APPLIED:
        return "applied";
    case HunkOutcome::WARNED:
        return "applied with warnings";
    case HunkOutcome::SKIPPED_NO_MATCH:
        return "skipped (no match)";
    case HunkOutcome::SKIPPED_AMBIGUOUS:
        return "skipped (ambiguous)";
    case HunkOutcome::PARSE_ERROR:
        return "parse error";
    case HunkOutcome::NOT_ATTEMPTED:
        return "not attempted";
    }
    return "unknown";
}

auto status_display_name(RunStatus status) -> std::string {
    switch (status) {
    case RunStatus::COMPLETED:
        return "completed";
    case RunStatus::CANCELLED:
        return "cancelled";
    case RunStatus::NO_VALID_HUNKS:
        return "no valid hunks found in patch";
    case RunStatus::CANCELLED_BEFORE_CHANGES:
        return "cancelled before any hunk was applied";
    }
    return "unknown";
}

auto outcome_event_type(HunkOutcome outcome) -> std::string {
    switch (outcome) {
    case HunkOutcome::APPLIED:
        return "HUNK_APPLIED";
    case HunkOutcome::WARNED:
        return "HUNK_WARNED";
    case HunkOutcome::SKIPPED_NO_MATCH:
    case HunkOutcome::SKIPPED_AMBIGUOUS:
        return "HUNK_SKIPPED";
    case HunkOutcome::PARSE_ERROR:
        return "HUNK_PARSE_ERROR";
    case HunkOutcome::NOT_ATTEMPTED:
        return "HUNK_NOT_ATTEMPTED";
    }
    return "HUNK_UNKNOWN";
}

auto format_hunk_details(const HunkReport& hunk) -> std::string {
    std::ostringstream oss;
    oss << "Hunk #" << hunk.number << " (patch line " << hunk.patch_line << ")\n";
    oss << "Header: " << hunk.header_line << "\n";
    oss << "Type: " << (hunk.kind ? kind_display_name(*hunk.kind) : std::string("unparsed")) << "\n";
    oss << "Status: " << outcome_display_name(hunk.outcome);

    if (hunk.resolved_line) {
        oss << "\nPosition: line " << *hunk.resolved_line + 1;
    }
    if (hunk.applied_range) {
        if (hunk.applied_range->end > hunk.applied_range->begin) {
            oss << "\nNew lines: " << hunk.applied_range->begin + 1 << "-"
                << hunk.applied_range->end;
        } else {
            oss << "\nNew lines: none (pure deletion)";
        }
        oss << "\nDelta: " << std::showpos << hunk.delta << std::noshowpos;
    }
    for (const auto& note : hunk.notes) {
        oss << "\nNote: " << note;
    }
    for (const auto& warning : hunk.warnings) {
        oss << "\nWarning: " << warning;
    }

    return oss.str();
}

auto format_summary(const PatchReport& report) -> std::string {
    size_t total = report.hunks.size();
    size_t applied = report.count(HunkOutcome::APPLIED) + report.count(HunkOutcome::WARNED);

    std::ostringstream oss;
    oss << "Total hunks: " << total << "\n";
    oss << "Applied: " << report.count(HunkOutcome::APPLIED) << "\n";
    oss << "Applied with warnings: " << report.count(HunkOutcome::WARNED) << "\n";
    oss << "Skipped (no match): " << report.count(HunkOutcome::SKIPPED_NO_MATCH) << "\n";
    oss << "Skipped (ambiguous): " << report.count(HunkOutcome::SKIPPED_AMBIGUOUS) << "\n";
    oss << "Parse errors: " << report.count(HunkOutcome::PARSE_ERROR) << "\n";
    oss << "Not attempted: " << report.count(HunkOutcome::NOT_ATTEMPTED) << "\n";
    if (total > 0) {
        oss << "Success rate: " << std::fixed << std::setprecision(1)
            << static_cast<double>(applied) * 100.0 / static_cast<double>(total) << "%\n";
    } else {
        oss << "Success rate: N/A\n";
    }
    oss << "Status: " << status_display_name(report.status);

    return oss.str();
}

} // namespace anchorpatch
