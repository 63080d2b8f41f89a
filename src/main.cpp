#include "anchorpatch/application/config.hpp"
#include "anchorpatch/application/patch_app.hpp"
#include "anchorpatch/io/file_system.hpp"
#include "anchorpatch/io/run_log.hpp"
#include "anchorpatch/parsers/patch_parser.hpp"
#include "anchorpatch/ui/ftxui_terminal.hpp"
#include "anchorpatch/ui/terminal.hpp"

#include <iostream>
#include <memory>
#include <string>
#include <vector>

auto main(int argc, char* argv[]) -> int {
    using namespace anchorpatch;

    std::vector<std::string> args(argv + 1, argv + argc);
    auto parsed = parse_arguments(args);

    if (parsed.show_help) {
        std::cout << usage_text();
        return 0;
    }
    if (!parsed.config) {
        std::cerr << "Error: " << parsed.error << "\n\n" << usage_text();
        return 2;
    }
    const auto& config = *parsed.config;

    std::unique_ptr<ITerminal> terminal;
    if (config.plain_terminal) {
        terminal = std::make_unique<Terminal>();
    } else {
        terminal = std::make_unique<FTXUITerminal>();
    }

    std::unique_ptr<IRunLog> log;
    if (config.log_enabled) {
        auto path = config.log_file.empty() ? default_log_path() : config.log_file;
        std::cout << "Log: " << path << "\n";
        log = std::make_unique<FileRunLog>(path);
    } else {
        log = std::make_unique<NullRunLog>();
    }

    PatchApp app(std::move(terminal), std::make_unique<FileSystem>(),
                 std::make_unique<PatchParser>(), std::move(log));
    return app.run(config);
}
