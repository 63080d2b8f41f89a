#pragma once

#include "anchorpatch/ui/terminal.hpp"
#include "anchorpatch/ui/ui_model.hpp"

#include <ftxui/component/component.hpp>
#include <ftxui/component/screen_interactive.hpp>
#include <ftxui/dom/elements.hpp>

namespace anchorpatch {

// Full-screen chooser and dialogs; prompts and pasted input stay line-based
class FTXUITerminal : public Terminal {
public:
    auto resolve(const DisambiguationRequest& request) -> Choice override;
    auto confirm(const std::string& question) -> bool override;
    auto show_report(const PatchReport& report) -> void override;

private:
    auto map_ftxui_event_to_input_event(const ftxui::Event& event) -> InputEvent;
    auto screen_to_ftxui_element(const Screen& screen) -> ftxui::Element;
};

} // namespace anchorpatch
