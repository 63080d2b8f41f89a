#pragma once

#include "anchorpatch/core/document.hpp"
#include <cstddef>
#include <string>
#include <vector>

namespace anchorpatch {

struct IndentationAnalysis {
    bool has_tabs = false;
    bool has_spaces = false;
    std::vector<size_t> mixed_lines;          // 1-based lines indented with both
    std::vector<size_t> inconsistent_widths;  // Space widths not a multiple of the narrowest
    size_t total_lines{};
    size_t indented_lines{};                  // Non-blank lines

    auto needs_fix() const -> bool;
};

struct IndentationStyle {
    bool use_spaces = true;
    size_t width = 4;   // Columns per level; an existing tab counts as this many
};

// .py / .pyw extension, or a "#!...python" first line
auto is_python_source(const std::string& path, const Document& document) -> bool;

auto analyze_indentation(const Document& document) -> IndentationAnalysis;

// Rewrites leading whitespace in whole units of style. A remainder narrower than one unit
// stays as spaces; whitespace-only lines become empty.
auto normalize_indentation(const Document& document, const IndentationStyle& style) -> Document;

auto describe_analysis(const IndentationAnalysis& analysis) -> std::string;

} // namespace anchorpatch
