#include "anchorpatch/ui/ui_model.hpp"
#include <iomanip>
#include <sstream>

namespace anchorpatch {

namespace {

auto format_window_line(size_t index, const std::string& text, bool in_match) -> std::string {
    std::ostringstream oss;
    oss << (in_match ? "  > " : "    ") << std::setw(5) << index + 1 << " | " << text;
    return oss.str();
}

} // namespace

auto create_disambiguation_model(DisambiguationRequest request) -> DisambiguationModel {
    DisambiguationModel model;
    model.request = std::move(request);
    return model;
}

auto update_disambiguation(DisambiguationModel model, InputEvent event) -> DisambiguationModel {
    // Any key other than QUIT withdraws a pending cancel
    if (event != InputEvent::QUIT && model.cancel_confirmation_needed) {
        model.cancel_confirmation_needed = false;
        model.status_message.clear();
    }

    size_t count = model.request.candidates.size();

    switch (event) {
    case InputEvent::ARROW_UP:
        if (model.selected > 0) {
            model.selected--;
            model.show_boundary_message = false;
        } else {
            model.show_boundary_message = true;
            model.status_message = "Already at first candidate.";
        }
        break;

    case InputEvent::ARROW_DOWN:
        if (model.selected + 1 < count) {
            model.selected++;
            model.show_boundary_message = false;
        } else {
            model.show_boundary_message = true;
            model.status_message = "Already at last candidate.";
        }
        break;

    case InputEvent::ENTER:
        model.mode = ViewMode::DONE;
        model.decided = count > 0 ? ChoiceAction::SELECT : ChoiceAction::SKIP;
        break;

    case InputEvent::SKIP:
        model.mode = ViewMode::DONE;
        model.decided = ChoiceAction::SKIP;
        break;

    case InputEvent::QUIT:
        if (!model.cancel_confirmation_needed) {
            model.cancel_confirmation_needed = true;
            model.status_message = "Cancel the remaining hunks? Press 'q' again to confirm, "
                                   "any other key to continue";
        } else {
            model.mode = ViewMode::DONE;
            model.decided = ChoiceAction::CANCEL;
        }
        break;

    case InputEvent::ESCAPE:
        model.show_boundary_message = false;
        model.status_message.clear();
        break;

    case InputEvent::UNKNOWN:
        break;
    }

    return model;
}

auto compose_disambiguation_screen(const DisambiguationModel& model) -> Screen {
    Screen screen;
    const auto& request = model.request;

    screen.content.push_back(
        {.text = "Hunk #" + std::to_string(request.hunk_number) + " (" + kind_display_name(request.kind)
                 + "): anchor found in " + std::to_string(request.candidates.size()) + " places"});
    for (const auto& line : request.anchor) {
        screen.content.push_back({.text = "Anchor: " + quote_line(line)});
    }
    screen.content.push_back({.text = ""});

    for (size_t i = 0; i < request.candidates.size(); ++i) {
        bool is_selected = i == model.selected;
        screen.content.push_back(
            {.text = std::string(is_selected ? "[x] " : "[ ] ") + "Candidate " + std::to_string(i + 1)
                     + " at line " + std::to_string(request.candidates[i].start + 1),
             .is_highlighted = is_selected});

        if (i < request.windows.size()) {
            const auto& window = request.windows[i];
            for (size_t j = 0; j < window.lines.size(); ++j) {
                size_t index = window.first_line + j;
                bool in_match = index >= window.match_begin && index < window.match_end;
                screen.content.push_back(
                    {.text = format_window_line(index, window.lines[j], in_match),
                     .is_highlighted = is_selected && in_match});
            }
        }
        screen.content.push_back({.text = ""});
    }

    if (model.cancel_confirmation_needed || model.show_boundary_message) {
        screen.status_line = model.status_message;
    } else {
        screen.status_line = "Candidate " + std::to_string(model.selected + 1) + "/"
                             + std::to_string(request.candidates.size());
    }
    screen.control_hints = "[Up/Down] Select | [Enter] Apply here | [s] Skip hunk | [q] Cancel run";

    return screen;
}

auto compose_report_screen(const PatchReport& report) -> Screen {
    Screen screen;

    for (const auto& hunk : report.hunks) {
        bool changed = hunk.outcome == HunkOutcome::APPLIED || hunk.outcome == HunkOutcome::WARNED;
        std::string position = hunk.resolved_line ? " at line " + std::to_string(*hunk.resolved_line + 1)
                                                  : "";
        screen.content.push_back({.text = "Hunk #" + std::to_string(hunk.number) + ": "
                                          + outcome_display_name(hunk.outcome) + position,
                                  .is_highlighted = changed});
        for (const auto& note : hunk.notes) {
            screen.content.push_back({.text = "    " + note});
        }
        for (const auto& warning : hunk.warnings) {
            screen.content.push_back({.text = "    warning: " + warning});
        }
    }

    size_t applied = report.count(HunkOutcome::APPLIED) + report.count(HunkOutcome::WARNED);
    screen.status_line = "Applied " + std::to_string(applied) + "/"
                         + std::to_string(report.hunks.size()) + " hunks ("
                         + status_display_name(report.status) + ")";
    return screen;
}

auto input_event_from_key(char key) -> InputEvent {
    switch (key) {
    case 's':
    case 'S':
        return InputEvent::SKIP;
    case 'q':
    case 'Q':
        return InputEvent::QUIT;
    case 'k':
        return InputEvent::ARROW_UP;
    case 'j':
        return InputEvent::ARROW_DOWN;
    case '\r':
    case '\n':
        return InputEvent::ENTER;
    default:
        return InputEvent::UNKNOWN;
    }
}

} // namespace anchorpatch
