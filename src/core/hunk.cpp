#include "anchorpatch/core/hunk.hpp"
#include <algorithm>

namespace anchorpatch {

auto hunk_kind(const HunkHeader& header) -> HunkKind {
    if (std::holds_alternative<ClassicHeader>(header)) {
        return HunkKind::CLASSIC;
    }
    if (std::holds_alternative<ExplicitAnchorHeader>(header)) {
        return HunkKind::EXPLICIT_ANCHOR;
    }
    return HunkKind::IMPLICIT_ANCHOR;
}

auto hunk_kind(const Hunk& hunk) -> HunkKind { return hunk_kind(hunk.header); }

auto kind_display_name(HunkKind kind) -> std::string {
    switch (kind) {
    case HunkKind::CLASSIC:
        return "classic";
    case HunkKind::EXPLICIT_ANCHOR:
        return "explicit anchor";
    case HunkKind::IMPLICIT_ANCHOR:
        return "implicit anchor";
    }
    return "unknown";
}

auto old_side_lines(const Hunk& hunk) -> std::vector<std::string> {
    std::vector<std::string> lines;
    for (const auto& op : hunk.ops) {
        if (op.tag != LineTag::ADD) {
            lines.push_back(op.text);
        }
    }
    return lines;
}

auto new_side_lines(const Hunk& hunk) -> std::vector<std::string> {
    std::vector<std::string> lines;
    for (const auto& op : hunk.ops) {
        if (op.tag != LineTag::REMOVE) {
            lines.push_back(op.text);
        }
    }
    return lines;
}

auto leading_remove_run(const Hunk& hunk) -> std::vector<std::string> {
    std::vector<std::string> run;
    for (const auto& op : hunk.ops) {
        if (op.tag != LineTag::REMOVE) {
            break;
        }
        run.push_back(op.text);
    }
    return run;
}

auto swap_roles(Hunk hunk) -> Hunk {
    for (auto& op : hunk.ops) {
        if (op.tag == LineTag::ADD) {
            op.tag = LineTag::REMOVE;
        } else if (op.tag == LineTag::REMOVE) {
            op.tag = LineTag::ADD;
        }
    }

    // Removals lead within each change run (same resulting text, derivable implicit anchor)
    auto run_begin = hunk.ops.begin();
    while (run_begin != hunk.ops.end()) {
        if (run_begin->tag == LineTag::CONTEXT) {
            ++run_begin;
            continue;
        }
        auto run_end = std::find_if(run_begin, hunk.ops.end(),
                                    [](const LineOp& op) { return op.tag == LineTag::CONTEXT; });
        std::stable_partition(run_begin, run_end,
                              [](const LineOp& op) { return op.tag == LineTag::REMOVE; });
        run_begin = run_end;
    }

    if (auto* classic = std::get_if<ClassicHeader>(&hunk.header)) {
        std::swap(classic->old_start, classic->new_start);
        std::swap(classic->old_count, classic->new_count);
    }

    return hunk;
}

} // namespace anchorpatch
