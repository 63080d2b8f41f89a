#include "anchorpatch/core/document.hpp"

namespace anchorpatch {

auto create_document(const std::vector<std::string>& lines) -> Document {
    return Document{.lines = lines, .line_ending = LineEnding::LF, .final_newline = true};
}

auto parse_document(std::string_view text) -> Document {
    Document document;
    if (text.empty()) {
        return document;
    }

    // The first terminator decides the style for the whole file
    auto first_newline = text.find('\n');
    if (first_newline != std::string_view::npos && first_newline > 0
        && text[first_newline - 1] == '\r') {
        document.line_ending = LineEnding::CRLF;
    }

    document.final_newline = text.back() == '\n';
    document.lines = split_lines(text);
    return document;
}

auto render_document(const Document& document) -> std::string {
    const std::string terminator = document.line_ending == LineEnding::CRLF ? "\r\n" : "\n";

    std::string output;
    for (size_t i = 0; i < document.lines.size(); ++i) {
        output += document.lines[i];
        bool is_last = i + 1 == document.lines.size();
        if (!is_last || document.final_newline) {
            output += terminator;
        }
    }
    return output;
}

auto split_lines(std::string_view text) -> std::vector<std::string> {
    std::vector<std::string> lines;
    size_t position = 0;

    while (position < text.size()) {
        auto newline = text.find('\n', position);
        if (newline == std::string_view::npos) {
            newline = text.size();
        }

        auto line = text.substr(position, newline - position);
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }
        lines.emplace_back(line);
        position = newline + 1;
    }

    return lines;
}

auto extract_indentation(const std::string& line) -> std::string {
    auto first_non_space = line.find_first_not_of(" \t");
    if (first_non_space == std::string::npos) {
        return "";
    }
    return line.substr(0, first_non_space);
}

auto rtrim(std::string_view text) -> std::string {
    auto end = text.find_last_not_of(" \t\r\n");
    if (end == std::string_view::npos) {
        return "";
    }
    return std::string(text.substr(0, end + 1));
}

auto quote_line(const std::string& text, size_t max_length) -> std::string {
    if (text.size() <= max_length) {
        return "'" + text + "'";
    }
    return "'" + text.substr(0, max_length) + "...'";
}

} // namespace anchorpatch
