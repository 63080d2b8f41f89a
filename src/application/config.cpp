#include "anchorpatch/application/config.hpp"
#include <algorithm>
#include <cctype>

namespace anchorpatch {

namespace {

auto parse_count(const std::string& text) -> std::optional<size_t> {
    if (text.empty() || text.size() > 9
        || !std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isdigit(c); })) {
        return std::nullopt;
    }
    return static_cast<size_t>(std::stoul(text));
}

auto parse_policy(const std::string& text) -> std::optional<AmbiguityPolicy> {
    if (text == "skip") {
        return AmbiguityPolicy::SKIP;
    }
    if (text == "first") {
        return AmbiguityPolicy::FIRST;
    }
    if (text == "cancel") {
        return AmbiguityPolicy::CANCEL;
    }
    return std::nullopt;
}

} // namespace

auto parse_arguments(const std::vector<std::string>& args) -> ParseArgsResult {
    ParseArgsResult result;
    Config config;

    auto fail = [&result](std::string message) {
        result.error = std::move(message);
        return result;
    };

    for (size_t i = 0; i < args.size(); ++i) {
        const auto& arg = args[i];

        auto next_value = [&]() -> std::optional<std::string> {
            if (i + 1 >= args.size()) {
                return std::nullopt;
            }
            return args[++i];
        };

        if (arg == "-h" || arg == "--help") {
            result.show_help = true;
            return result;
        } else if (arg == "-t" || arg == "--target") {
            auto value = next_value();
            if (!value) {
                return fail("missing value for " + arg);
            }
            config.target_file = *value;
        } else if (arg == "-p" || arg == "--patch") {
            auto value = next_value();
            if (!value) {
                return fail("missing value for " + arg);
            }
            config.patch_file = *value;
        } else if (arg == "-c" || arg == "--context") {
            auto value = next_value();
            if (!value) {
                return fail("missing value for " + arg);
            }
            auto count = parse_count(*value);
            if (!count) {
                return fail("invalid context line count: " + *value);
            }
            config.context_lines = *count;
        } else if (arg == "-r" || arg == "--revert") {
            config.revert = true;
        } else if (arg == "--dry-run") {
            config.dry_run = true;
        } else if (arg == "-y" || arg == "--yes") {
            config.assume_yes = true;
        } else if (arg == "--non-interactive") {
            config.interactive = false;
        } else if (arg == "--ambiguous") {
            auto value = next_value();
            if (!value) {
                return fail("missing value for " + arg);
            }
            auto policy = parse_policy(*value);
            if (!policy) {
                return fail("unknown ambiguity policy: " + *value + " (expected skip, first or cancel)");
            }
            config.ambiguity = *policy;
        } else if (arg == "--no-backup") {
            config.create_backup = false;
        } else if (arg == "--no-indent-fix") {
            config.fix_indentation = false;
        } else if (arg == "--tab-size") {
            auto value = next_value();
            if (!value) {
                return fail("missing value for " + arg);
            }
            auto width = parse_count(*value);
            if (!width || *width == 0) {
                return fail("invalid tab size: " + *value);
            }
            config.indentation.width = *width;
        } else if (arg == "--use-tabs") {
            config.indentation.use_spaces = false;
        } else if (arg == "--log") {
            auto value = next_value();
            if (!value) {
                return fail("missing value for " + arg);
            }
            config.log_file = *value;
            config.log_enabled = true;
        } else if (arg == "--no-log") {
            config.log_enabled = false;
        } else if (arg == "--plain") {
            config.plain_terminal = true;
        } else if (arg.size() > 1 && arg[0] == '-') {
            return fail("unknown option: " + arg);
        } else if (config.target_file.empty()) {
            config.target_file = arg;
        } else {
            return fail("unexpected argument: " + arg);
        }
    }

    result.config = config;
    return result;
}

auto usage_text() -> std::string {
    return "Usage: anchorpatch [options] [target]\n"
           "  -t, --target <file>        File to patch (asked for when omitted)\n"
           "  -p, --patch <file>         Patch file, '-' for stdin (default: pick a .diff or paste)\n"
           "  -c, --context <n>          Context lines shown per candidate (default 3)\n"
           "  -r, --revert               Apply the patch in reverse\n"
           "      --dry-run              Report only, never write\n"
           "  -y, --yes                  Write without asking\n"
           "      --non-interactive      Never prompt; see --ambiguous\n"
           "      --ambiguous <policy>   skip | first | cancel (default skip)\n"
           "      --no-backup            Do not back up the target before writing\n"
           "      --no-indent-fix        Leave Python indentation alone\n"
           "      --tab-size <n>         Indentation width for the fixer (default 4)\n"
           "      --use-tabs             Indent with tabs when fixing\n"
           "      --log <file>           Run log location\n"
           "      --no-log               Do not write a run log\n"
           "      --plain                Line-based prompts instead of full-screen dialogs\n"
           "  -h, --help                 Show this help\n"
           "\nExamples:\n"
           "  anchorpatch app.py -p fix.diff           # Apply a patch file\n"
           "  git diff | anchorpatch app.py -p -       # Patch from stdin\n"
           "  anchorpatch app.py -p fix.diff -r        # Undo a patch\n"
           "  anchorpatch app.py -p fix.diff --non-interactive --ambiguous first --yes\n";
}

} // namespace anchorpatch
