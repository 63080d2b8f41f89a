#include "anchorpatch/core/indentation.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <set>
#include <sstream>

namespace anchorpatch {

namespace {

auto is_blank(const std::string& line) -> bool {
    return line.find_first_not_of(" \t") == std::string::npos;
}

auto to_lower(std::string text) -> std::string {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

} // namespace

auto IndentationAnalysis::needs_fix() const -> bool {
    return (has_tabs && has_spaces) || !mixed_lines.empty() || !inconsistent_widths.empty();
}

auto is_python_source(const std::string& path, const Document& document) -> bool {
    auto extension = to_lower(std::filesystem::path(path).extension().string());
    if (extension == ".py" || extension == ".pyw") {
        return true;
    }

    if (document.lines.empty()) {
        return false;
    }
    const auto& first = document.lines.front();
    return first.starts_with("#!") && to_lower(first).find("python") != std::string::npos;
}

auto analyze_indentation(const Document& document) -> IndentationAnalysis {
    IndentationAnalysis analysis;
    analysis.total_lines = document.lines.size();
    std::set<size_t> space_widths;

    for (size_t i = 0; i < document.lines.size(); ++i) {
        const auto& line = document.lines[i];
        if (is_blank(line)) {
            continue;
        }
        ++analysis.indented_lines;

        auto indent = extract_indentation(line);
        bool tabs = indent.find('\t') != std::string::npos;
        bool spaces = indent.find(' ') != std::string::npos;

        analysis.has_tabs = analysis.has_tabs || tabs;
        analysis.has_spaces = analysis.has_spaces || spaces;
        if (tabs && spaces) {
            analysis.mixed_lines.push_back(i + 1);
        } else if (spaces) {
            space_widths.insert(indent.size());
        }
    }

    if (space_widths.size() > 1) {
        auto base = *space_widths.begin();
        for (auto width : space_widths) {
            if (width % base != 0) {
                analysis.inconsistent_widths.push_back(width);
            }
        }
    }

    return analysis;
}

auto normalize_indentation(const Document& document, const IndentationStyle& style) -> Document {
    Document result = document;
    size_t width = std::max<size_t>(style.width, 1);
    const std::string unit = style.use_spaces ? std::string(width, ' ') : std::string("\t");

    for (auto& line : result.lines) {
        if (is_blank(line)) {
            line.clear();
            continue;
        }

        auto indent = extract_indentation(line);
        size_t columns = 0;
        for (char c : indent) {
            columns += c == '\t' ? width : 1;
        }

        std::string rebuilt;
        for (size_t level = 0; level < columns / width; ++level) {
            rebuilt += unit;
        }
        rebuilt.append(columns % width, ' ');
        line = rebuilt + line.substr(indent.size());
    }

    return result;
}

auto describe_analysis(const IndentationAnalysis& analysis) -> std::string {
    std::ostringstream oss;
    if (analysis.has_tabs && analysis.has_spaces) {
        oss << "Mixed indentation: tabs and spaces\n";
    }
    if (!analysis.mixed_lines.empty()) {
        oss << analysis.mixed_lines.size() << " line(s) mix tabs and spaces\n";
    }
    if (!analysis.inconsistent_widths.empty()) {
        oss << "Inconsistent indentation widths\n";
    }
    if (!analysis.needs_fix()) {
        oss << "Indentation is consistent\n";
    }
    oss << analysis.indented_lines << " non-blank lines of " << analysis.total_lines << " total";
    return oss.str();
}

} // namespace anchorpatch
