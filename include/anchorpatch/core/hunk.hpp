#pragma once

#include <string>
#include <variant>
#include <vector>

namespace anchorpatch {

enum class LineTag {
    CONTEXT,  // ' ' - unchanged line, used for verification
    REMOVE,   // '-'
    ADD       // '+'
};

struct LineOp {
    LineTag tag = LineTag::CONTEXT;
    std::string text;

    auto operator==(const LineOp& other) const -> bool = default;
};

enum class HunkKind {
    CLASSIC,          // @@ -a,b +c,d @@
    EXPLICIT_ANCHOR,  // @@ <anchor text>
    IMPLICIT_ANCHOR   // @@ (anchor = leading removals)
};

// 1-based line numbers, as written in the header
struct ClassicHeader {
    size_t old_start{};
    size_t old_count{};
    size_t new_start{};
    size_t new_count{};

    auto operator==(const ClassicHeader& other) const -> bool = default;
};

struct ExplicitAnchorHeader {
    std::string anchor;

    auto operator==(const ExplicitAnchorHeader& other) const -> bool = default;
};

struct ImplicitAnchorHeader {
    auto operator==(const ImplicitAnchorHeader& other) const -> bool = default;
};

// Each kind carries only what its own location strategy needs
using HunkHeader = std::variant<ClassicHeader, ExplicitAnchorHeader, ImplicitAnchorHeader>;

struct Hunk {
    HunkHeader header;
    std::vector<LineOp> ops;     // Patch order is significant
    std::string header_line;     // Raw header text, for reporting
    size_t patch_line{};         // 1-based line of the header in the patch text
};

auto hunk_kind(const HunkHeader& header) -> HunkKind;
auto hunk_kind(const Hunk& hunk) -> HunkKind;
auto kind_display_name(HunkKind kind) -> std::string;

// Lines the hunk expects to find (Context + Remove) and leaves behind (Context + Add)
auto old_side_lines(const Hunk& hunk) -> std::vector<std::string>;
auto new_side_lines(const Hunk& hunk) -> std::vector<std::string>;

// Leading contiguous run of Remove lines; the anchor of an implicit-anchor hunk
auto leading_remove_run(const Hunk& hunk) -> std::vector<std::string>;

// Reverse a hunk: Add <-> Remove, old <-> new header fields. Within each run of changed
// lines, removals are kept ahead of additions.
auto swap_roles(Hunk hunk) -> Hunk;

} // namespace anchorpatch
