#pragma once

#include "anchorpatch/core/document.hpp"
#include "anchorpatch/core/hunk.hpp"
#include "anchorpatch/core/report.hpp"
#include <cstddef>
#include <string>
#include <vector>

namespace anchorpatch {

struct ApplyResult {
    HunkOutcome outcome = HunkOutcome::SKIPPED_NO_MATCH;
    std::ptrdiff_t delta{};      // new line count - old line count
    LineRange range;             // Lines now holding the hunk's new side
    std::vector<std::string> warnings;
};

// Header counts vs. body for classic hunks; empty for other kinds
auto header_count_warnings(const Hunk& hunk) -> std::vector<std::string>;

// One warning per Context/Remove line that differs from the document at start
auto find_divergences(const Document& document, const Hunk& hunk, size_t start)
    -> std::vector<std::string>;

// Replace the hunk's old side at start with its new side. The hunk's own text wins over
// stale context; a span outside the document leaves it untouched.
auto apply_hunk(Document& document, const Hunk& hunk, size_t start) -> ApplyResult;

} // namespace anchorpatch
