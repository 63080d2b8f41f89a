#include "anchorpatch/core/hunk_applier.hpp"
#include <algorithm>

namespace anchorpatch {

namespace {

// Lines the hunk claims from the document, taking the header's word for classic hunks
auto claimed_span(const Hunk& hunk) -> size_t {
    size_t span = old_side_lines(hunk).size();
    if (const auto* classic = std::get_if<ClassicHeader>(&hunk.header)) {
        span = std::max(span, classic->old_count);
    }
    return span;
}

} // namespace

auto header_count_warnings(const Hunk& hunk) -> std::vector<std::string> {
    std::vector<std::string> warnings;
    const auto* classic = std::get_if<ClassicHeader>(&hunk.header);
    if (classic == nullptr) {
        return warnings;
    }

    auto old_count = old_side_lines(hunk).size();
    auto new_count = new_side_lines(hunk).size();
    if (old_count != classic->old_count) {
        warnings.push_back("header old count " + std::to_string(classic->old_count)
                           + " but hunk has " + std::to_string(old_count)
                           + " context/removed lines");
    }
    if (new_count != classic->new_count) {
        warnings.push_back("header new count " + std::to_string(classic->new_count)
                           + " but hunk has " + std::to_string(new_count)
                           + " context/added lines");
    }
    return warnings;
}

auto find_divergences(const Document& document, const Hunk& hunk, size_t start)
    -> std::vector<std::string> {
    std::vector<std::string> divergences;
    auto expected = old_side_lines(hunk);

    for (size_t i = 0; i < expected.size(); ++i) {
        size_t line_index = start + i;
        if (line_index >= document.lines.size()) {
            divergences.push_back("context divergence at line " + std::to_string(line_index + 1)
                                  + ": expected " + quote_line(expected[i])
                                  + ", found end of file");
            continue;
        }
        if (document.lines[line_index] != expected[i]) {
            divergences.push_back("context divergence at line " + std::to_string(line_index + 1)
                                  + ": expected " + quote_line(expected[i]) + ", found "
                                  + quote_line(document.lines[line_index]));
        }
    }

    return divergences;
}

auto apply_hunk(Document& document, const Hunk& hunk, size_t start) -> ApplyResult {
    ApplyResult result;

    size_t span = claimed_span(hunk);
    if (start > document.lines.size() || span > document.lines.size() - start) {
        result.outcome = HunkOutcome::SKIPPED_NO_MATCH;
        result.warnings.push_back("hunk span (lines " + std::to_string(start + 1) + "-"
                                  + std::to_string(start + span) + ") exceeds document length "
                                  + std::to_string(document.lines.size()));
        return result;
    }

    result.warnings = header_count_warnings(hunk);
    auto divergences = find_divergences(document, hunk, start);
    result.warnings.insert(result.warnings.end(), divergences.begin(), divergences.end());

    auto old_lines = old_side_lines(hunk);
    auto new_lines = new_side_lines(hunk);

    auto first = document.lines.begin() + static_cast<std::ptrdiff_t>(start);
    auto last = first + static_cast<std::ptrdiff_t>(old_lines.size());
    auto inserted_at = document.lines.erase(first, last);
    document.lines.insert(inserted_at, new_lines.begin(), new_lines.end());

    result.delta = static_cast<std::ptrdiff_t>(new_lines.size())
                   - static_cast<std::ptrdiff_t>(old_lines.size());
    result.range = LineRange{.begin = start, .end = start + new_lines.size()};
    result.outcome = result.warnings.empty() ? HunkOutcome::APPLIED : HunkOutcome::WARNED;

    return result;
}

} // namespace anchorpatch
