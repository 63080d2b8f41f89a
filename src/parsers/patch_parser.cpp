#include "anchorpatch/parsers/patch_parser.hpp"
#include "anchorpatch/core/document.hpp"
#include <algorithm>

namespace anchorpatch {

auto ParsedPatch::valid_hunk_count() const -> size_t {
    return static_cast<size_t>(std::count_if(blocks.begin(), blocks.end(),
                                             [](const PatchBlock& block) {
                                                 return block.hunk.has_value();
                                             }));
}

auto PatchParser::parse_patch(const std::string& patch_text) -> ParsedPatch {
    ParsedPatch patch;
    auto lines = split_lines(patch_text);

    size_t i = 0;
    while (i < lines.size()) {
        // Anything outside a block (diff/index/---/+++ preamble) is ignored
        if (!is_header_line(lines[i])) {
            ++i;
            continue;
        }

        size_t header_index = i;
        std::vector<std::string> body;
        ++i;
        while (i < lines.size() && !is_header_line(lines[i]) && !is_file_header_pair(lines, i)) {
            body.push_back(lines[i]);
            ++i;
        }

        auto block = parse_block(lines[header_index], body);
        block.patch_line = header_index + 1;
        if (block.hunk) {
            block.hunk->patch_line = block.patch_line;
        }
        patch.blocks.push_back(std::move(block));
    }

    return patch;
}

auto PatchParser::classify_header(const std::string& header_line) -> HeaderClassification {
    // Only the line terminator goes; an anchor's trailing whitespace is part of the text
    std::string line = header_line;
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }

    if (line.rfind("@@", 0) != 0) {
        return {.header = std::nullopt, .error = "missing '@@' hunk marker"};
    }

    std::smatch match;
    if (std::regex_match(line, match, classic_pattern_)) {
        try {
            auto number = [&match](size_t group) -> size_t {
                return match[group].matched ? static_cast<size_t>(std::stoul(match[group].str())) : 1;
            };
            ClassicHeader classic{.old_start = number(1),
                                  .old_count = number(2),
                                  .new_start = number(3),
                                  .new_count = number(4)};
            return {.header = classic, .error = ""};
        } catch (const std::exception&) {
            return {.header = std::nullopt, .error = "line number out of range in header"};
        }
    }

    auto rest = line.substr(2);
    if (rtrim(rest).empty()) {
        return {.header = ImplicitAnchorHeader{}, .error = ""};
    }
    if (rest.front() == '@') {
        return {.header = std::nullopt, .error = "combined diff headers are not supported"};
    }
    if (std::regex_search(rest, offset_like_pattern_)) {
        return {.header = std::nullopt, .error = "malformed line-offset header"};
    }

    // Exactly one separator after the marker; the anchor keeps its own indentation
    if (rest.front() == ' ' || rest.front() == '\t') {
        rest.erase(0, 1);
    }
    return {.header = ExplicitAnchorHeader{.anchor = rest}, .error = ""};
}

auto PatchParser::parse_hunk(HunkHeader header, const std::vector<std::string>& body) -> Hunk {
    Hunk hunk{.header = std::move(header), .ops = {}, .header_line = "", .patch_line = 0};

    // Pasted patches often end with empty lines that are not part of the hunk. A context
    // line for an empty source line is " ", so it survives this.
    auto last = body.end();
    while (last != body.begin() && ((last - 1)->empty() || *(last - 1) == "\r")) {
        --last;
    }

    for (auto it = body.begin(); it != last; ++it) {
        if (!it->empty() && it->front() == '\\') {
            continue;  // "\ No newline at end of file"
        }
        hunk.ops.push_back(parse_body_line(*it));
    }

    return hunk;
}

auto PatchParser::parse_body_line(const std::string& line) -> LineOp {
    std::string text = line;
    if (!text.empty() && text.back() == '\r') {
        text.pop_back();
    }

    if (text.empty()) {
        return LineOp{.tag = LineTag::CONTEXT, .text = ""};
    }

    switch (text.front()) {
    case '+':
        return LineOp{.tag = LineTag::ADD, .text = text.substr(1)};
    case '-':
        return LineOp{.tag = LineTag::REMOVE, .text = text.substr(1)};
    case ' ':
        return LineOp{.tag = LineTag::CONTEXT, .text = text.substr(1)};
    default:
        // Untagged lines are context taken verbatim
        return LineOp{.tag = LineTag::CONTEXT, .text = text};
    }
}

auto PatchParser::is_header_line(const std::string& line) -> bool { return line.rfind("@@", 0) == 0; }

auto PatchParser::is_file_header_pair(const std::vector<std::string>& lines, size_t index) -> bool {
    if (index + 1 >= lines.size() || lines[index].rfind("--- ", 0) != 0
        || lines[index + 1].rfind("+++ ", 0) != 0) {
        return false;
    }

    // A file header always introduces a hunk; otherwise the pair is a removed "-- " line
    // followed by an added "++ " line
    for (size_t next = index + 2; next < lines.size(); ++next) {
        if (rtrim(lines[next]).empty()) {
            continue;
        }
        return is_header_line(lines[next]);
    }
    return true;
}

auto PatchParser::parse_block(const std::string& header_line,
                              const std::vector<std::string>& body) -> PatchBlock {
    PatchBlock block{.patch_line = 0, .header_line = rtrim(header_line), .hunk = std::nullopt,
                     .error = ""};

    auto classification = classify_header(header_line);
    if (!classification.header) {
        block.error = classification.error;
        return block;
    }

    auto hunk = parse_hunk(std::move(*classification.header), body);
    hunk.header_line = block.header_line;

    if (hunk_kind(hunk) == HunkKind::IMPLICIT_ANCHOR && leading_remove_run(hunk).empty()) {
        block.error = "implicit-anchor hunk must start with removed lines";
        return block;
    }

    block.hunk = std::move(hunk);
    return block;
}

} // namespace anchorpatch
