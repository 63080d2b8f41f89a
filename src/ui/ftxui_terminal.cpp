#include "anchorpatch/ui/ftxui_terminal.hpp"

#include <ftxui/component/component.hpp>
#include <ftxui/component/component_base.hpp>
#include <ftxui/component/event.hpp>
#include <ftxui/component/screen_interactive.hpp>
#include <ftxui/dom/elements.hpp>
#include <ftxui/screen/screen.hpp>

#include <iostream>

namespace anchorpatch {

auto FTXUITerminal::resolve(const DisambiguationRequest& request) -> Choice {
    using namespace ftxui;

    auto current_model = create_disambiguation_model(request);
    auto screen = ScreenInteractive::Fullscreen();

    auto component = CatchEvent(
        Renderer([&] { return screen_to_ftxui_element(compose_disambiguation_screen(current_model)); }),
        [&](Event event) -> bool {
            auto input_event = map_ftxui_event_to_input_event(event);
            if (input_event == InputEvent::UNKNOWN) {
                return false; // Event not handled
            }

            current_model = update_disambiguation(current_model, input_event);
            if (current_model.mode == ViewMode::DONE) {
                screen.ExitLoopClosure()();
            }
            return true;
        });

    screen.Loop(component);
    return current_model.to_choice();
}

auto FTXUITerminal::confirm(const std::string& question) -> bool {
    using namespace ftxui;

    bool answer = false;
    auto screen = ScreenInteractive::TerminalOutput();

    auto component = CatchEvent(
        Renderer([&] {
            return vbox({text(question) | bold,
                         separator(),
                         text("[y] Yes | [n] No") | dim})
                   | border;
        }),
        [&](Event event) -> bool {
            if (event == Event::Character('y') || event == Event::Character('Y')) {
                answer = true;
                screen.ExitLoopClosure()();
                return true;
            }
            if (event == Event::Character('n') || event == Event::Character('N')
                || event == Event::Escape || event == Event::Return) {
                answer = false;
                screen.ExitLoopClosure()();
                return true;
            }
            return false;
        });

    screen.Loop(component);
    return answer;
}

auto FTXUITerminal::show_report(const PatchReport& report) -> void {
    auto element = screen_to_ftxui_element(compose_report_screen(report));
    auto ftxui_screen = ftxui::Screen::Create(ftxui::Dimension::Full(),
                                              ftxui::Dimension::Fit(element));
    ftxui::Render(ftxui_screen, element);
    std::cout << ftxui_screen.ToString() << std::endl;
}

auto FTXUITerminal::map_ftxui_event_to_input_event(const ftxui::Event& event) -> InputEvent {
    if (event == ftxui::Event::ArrowUp) {
        return InputEvent::ARROW_UP;
    }
    if (event == ftxui::Event::ArrowDown) {
        return InputEvent::ARROW_DOWN;
    }
    if (event == ftxui::Event::Escape) {
        return InputEvent::ESCAPE;
    }
    if (event == ftxui::Event::Return) {
        return InputEvent::ENTER;
    }

    // Character input - only map single character commands
    if (event.is_character()) {
        std::string chars = event.character();
        if (chars.length() == 1) {
            return input_event_from_key(chars[0]);
        }
    }

    return InputEvent::UNKNOWN;
}

auto FTXUITerminal::screen_to_ftxui_element(const Screen& screen) -> ftxui::Element {
    using namespace ftxui;

    Elements content_elements;
    for (const auto& line : screen.content) {
        if (line.is_highlighted) {
            content_elements.push_back(text(line.text) | color(Color::Green) | focus);
        } else {
            content_elements.push_back(text(line.text));
        }
    }

    auto content_box = vbox(std::move(content_elements)) | vscroll_indicator | frame;

    auto status_element = text(screen.status_line) | bold | color(Color::Cyan);

    Elements layout = {content_box | flex, separator(), status_element};
    if (!screen.control_hints.empty()) {
        layout.push_back(text(screen.control_hints) | dim);
    }
    return vbox(std::move(layout));
}

} // namespace anchorpatch
