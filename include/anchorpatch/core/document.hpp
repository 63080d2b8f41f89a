#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace anchorpatch {

// Line ending style
enum class LineEnding {
    LF,     // Unix/Linux/macOS
    CRLF    // Windows
};

// In-memory target file. Lines are stored without terminators.
struct Document {
    std::vector<std::string> lines;
    LineEnding line_ending = LineEnding::LF;
    bool final_newline = true;

    auto operator==(const Document& other) const -> bool = default;
};

// Pure functions for Document construction and rendering
auto create_document(const std::vector<std::string>& lines) -> Document;
auto parse_document(std::string_view text) -> Document;
auto render_document(const Document& document) -> std::string;

// Split text into lines, dropping "\n" / "\r\n" terminators
auto split_lines(std::string_view text) -> std::vector<std::string>;

// Extract indentation (leading whitespace) from a line
auto extract_indentation(const std::string& line) -> std::string;

auto rtrim(std::string_view text) -> std::string;

// Single-quoted, shortened copy of a line for messages
auto quote_line(const std::string& text, size_t max_length = 60) -> std::string;

} // namespace anchorpatch
