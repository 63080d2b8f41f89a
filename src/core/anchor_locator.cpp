#include "anchorpatch/core/anchor_locator.hpp"
#include <algorithm>

namespace anchorpatch {

auto anchor_lines(const Hunk& hunk) -> std::vector<std::string> {
    switch (hunk_kind(hunk)) {
    case HunkKind::EXPLICIT_ANCHOR:
        return {std::get<ExplicitAnchorHeader>(hunk.header).anchor};
    case HunkKind::IMPLICIT_ANCHOR:
        return leading_remove_run(hunk);
    case HunkKind::CLASSIC:
        break;
    }
    return {};
}

auto find_block_occurrences(const std::vector<std::string>& lines,
                            const std::vector<std::string>& block) -> std::vector<MatchCandidate> {
    std::vector<MatchCandidate> candidates;
    if (block.empty() || block.size() > lines.size()) {
        return candidates;
    }

    for (size_t i = 0; i + block.size() <= lines.size(); ++i) {
        if (std::equal(block.begin(), block.end(), lines.begin() + static_cast<std::ptrdiff_t>(i))) {
            candidates.push_back(MatchCandidate{.start = i, .span = block.size()});
        }
    }

    return candidates;
}

auto locate_anchor(const Document& document, const Hunk& hunk) -> std::vector<MatchCandidate> {
    return find_block_occurrences(document.lines, anchor_lines(hunk));
}

auto anchored_start(const Hunk& hunk, const MatchCandidate& candidate) -> size_t {
    const auto* explicit_header = std::get_if<ExplicitAnchorHeader>(&hunk.header);
    if (explicit_header == nullptr) {
        return candidate.start;
    }

    // The anchor may be repeated as the hunk's first context/removed line, or merely
    // precede the edited region
    auto old_lines = old_side_lines(hunk);
    if (!old_lines.empty() && old_lines.front() == explicit_header->anchor) {
        return candidate.start;
    }
    return candidate.start + candidate.span;
}

auto build_context_window(const Document& document, const MatchCandidate& candidate,
                          size_t context_lines) -> ContextWindow {
    ContextWindow window;
    size_t line_count = document.lines.size();

    window.match_begin = std::min(candidate.start, line_count);
    window.match_end = std::min(candidate.start + candidate.span, line_count);
    window.first_line = window.match_begin >= context_lines ? window.match_begin - context_lines : 0;
    size_t last_line = std::min(window.match_end + context_lines, line_count);

    for (size_t i = window.first_line; i < last_line; ++i) {
        window.lines.push_back(document.lines[i]);
    }

    return window;
}

auto classic_line_index(size_t line, size_t count, std::ptrdiff_t offset) -> std::optional<size_t> {
    auto base = static_cast<std::ptrdiff_t>(line);
    if (count > 0 && base > 0) {
        base -= 1;
    }

    auto index = base + offset;
    if (index < 0) {
        return std::nullopt;
    }
    return static_cast<size_t>(index);
}

auto old_side_matches(const Document& document, const Hunk& hunk, size_t start) -> bool {
    auto expected = old_side_lines(hunk);
    if (start > document.lines.size() || expected.size() > document.lines.size() - start) {
        return false;
    }
    return std::equal(expected.begin(), expected.end(),
                      document.lines.begin() + static_cast<std::ptrdiff_t>(start));
}

auto resolve_classic_start(const Document& document, const Hunk& hunk, std::ptrdiff_t offset)
    -> std::optional<size_t> {
    const auto* header = std::get_if<ClassicHeader>(&hunk.header);
    if (header == nullptr) {
        return std::nullopt;
    }

    auto primary = classic_line_index(header->new_start, header->new_count, offset);
    if (primary && old_side_matches(document, hunk, *primary)) {
        return primary;
    }

    auto fallback = classic_line_index(header->old_start, header->old_count, offset);
    if (fallback && fallback != primary && old_side_matches(document, hunk, *fallback)) {
        return fallback;
    }

    return primary;
}

} // namespace anchorpatch
