#pragma once

#include "anchorpatch/core/document.hpp"
#include "anchorpatch/core/hunk.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace anchorpatch {

// A place in the current document where a hunk's anchor occurs
struct MatchCandidate {
    size_t start{};  // 0-based line index
    size_t span{};   // Number of matched lines

    auto operator==(const MatchCandidate& other) const -> bool = default;
};

// Document lines around a candidate, for a human (or script) to choose from
struct ContextWindow {
    size_t first_line{};              // 0-based index of lines[0]
    std::vector<std::string> lines;
    size_t match_begin{};             // 0-based document indices of the match, half-open
    size_t match_end{};
};

// Anchor text a hunk is located by: the explicit anchor line, or the leading removals of
// an implicit-anchor hunk. Classic hunks have none.
auto anchor_lines(const Hunk& hunk) -> std::vector<std::string>;

// Every position where block occurs verbatim as contiguous lines, ascending
auto find_block_occurrences(const std::vector<std::string>& lines,
                            const std::vector<std::string>& block) -> std::vector<MatchCandidate>;

auto locate_anchor(const Document& document, const Hunk& hunk) -> std::vector<MatchCandidate>;

// Line at which the hunk's old side begins once its anchor has been found at candidate
auto anchored_start(const Hunk& hunk, const MatchCandidate& candidate) -> size_t;

auto build_context_window(const Document& document, const MatchCandidate& candidate,
                          size_t context_lines) -> ContextWindow;

// 0-based index a classic header line number refers to, shifted by offset. A zero count
// means the hunk sits after the given line.
auto classic_line_index(size_t line, size_t count, std::ptrdiff_t offset) -> std::optional<size_t>;

// True when the hunk's Context/Remove lines are present verbatim at start
auto old_side_matches(const Document& document, const Hunk& hunk, size_t start) -> bool;

// Start line for a classic hunk given the cumulative offset of earlier hunks. Prefers the
// new-start position; falls back to the old-start position only when that one verifies.
auto resolve_classic_start(const Document& document, const Hunk& hunk, std::ptrdiff_t offset)
    -> std::optional<size_t>;

} // namespace anchorpatch
