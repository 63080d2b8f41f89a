#pragma once

#include "anchorpatch/core/disambiguation.hpp"
#include "anchorpatch/core/report.hpp"
#include <string>
#include <vector>

namespace anchorpatch {

// Input events from terminal
enum class InputEvent {
    ARROW_UP,
    ARROW_DOWN,
    ENTER,
    SKIP,
    QUIT,
    ESCAPE,
    UNKNOWN
};

// View modes for the chooser
enum class ViewMode {
    CHOOSING,
    DONE
};

// Immutable chooser state - ALL disambiguation UI state in one place
struct DisambiguationModel {
    DisambiguationRequest request;

    size_t selected{};
    ViewMode mode = ViewMode::CHOOSING;
    ChoiceAction decided = ChoiceAction::SKIP;   // Meaningful once mode == DONE

    bool show_boundary_message = false;          // "Already at first candidate"
    bool cancel_confirmation_needed = false;     // Prevent accidental cancel
    std::string status_message;

    auto to_choice() const -> Choice {
        return Choice{.action = decided, .index = selected};
    }
};

// Screen structure for declarative rendering
struct Line {
    std::string text;
    bool is_highlighted = false;
};

struct Screen {
    std::vector<Line> content;
    std::string status_line;
    std::string control_hints;
};

auto create_disambiguation_model(DisambiguationRequest request) -> DisambiguationModel;

// Pure state transition
auto update_disambiguation(DisambiguationModel model, InputEvent event) -> DisambiguationModel;

auto compose_disambiguation_screen(const DisambiguationModel& model) -> Screen;
auto compose_report_screen(const PatchReport& report) -> Screen;

// Single-key commands shared by the line and full-screen terminals
auto input_event_from_key(char key) -> InputEvent;

} // namespace anchorpatch
