#pragma once

#include "anchorpatch/core/hunk.hpp"
#include "anchorpatch/interfaces.hpp"
#include <optional>
#include <regex>
#include <string>
#include <vector>

namespace anchorpatch {

// One "@@" block of the patch: either a parsed hunk or the reason it was dropped
struct PatchBlock {
    size_t patch_line{};          // 1-based line of the header
    std::string header_line;
    std::optional<Hunk> hunk;
    std::string error;            // Set when hunk is empty
};

struct ParsedPatch {
    std::vector<PatchBlock> blocks;  // File order

    auto valid_hunk_count() const -> size_t;
};

// Result of classifying a header line
struct HeaderClassification {
    std::optional<HunkHeader> header;
    std::string error;
};

class PatchParser : public IPatchParser {
public:
    auto parse_patch(const std::string& patch_text) -> ParsedPatch override;

    // Hunk classifier: decide the kind of a block from its header line
    static auto classify_header(const std::string& header_line) -> HeaderClassification;

    // Hunk parser: build the ordered line operations of one block
    static auto parse_hunk(HunkHeader header, const std::vector<std::string>& body) -> Hunk;
    static auto parse_body_line(const std::string& line) -> LineOp;

private:
    static auto is_header_line(const std::string& line) -> bool;
    static auto is_file_header_pair(const std::vector<std::string>& lines, size_t index) -> bool;
    static auto parse_block(const std::string& header_line,
                            const std::vector<std::string>& body) -> PatchBlock;

    // @@ -old_start[,old_count] +new_start[,new_count] @@ [ignored]
    static inline const std::regex classic_pattern_{
        R"(^@@\s*-(\d+)(?:,(\d+))?\s+\+(\d+)(?:,(\d+))?\s*@@.*$)"};
    // Text that starts like a line-offset header
    static inline const std::regex offset_like_pattern_{R"(^\s*-\d)"};
};

} // namespace anchorpatch
