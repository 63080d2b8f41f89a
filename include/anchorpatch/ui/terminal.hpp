#pragma once

#include "anchorpatch/interfaces.hpp"
#include "anchorpatch/ui/ui_model.hpp"
#include <cstdio>
#include <termios.h>

namespace anchorpatch {

// Line-oriented terminal; the chooser runs in raw mode
class Terminal : public ITerminal {
private:
    FILE* tty_file_ = nullptr;          // /dev/tty for piped input support
    bool use_tty_ = false;              // Flag for /dev/tty usage
    bool termios_saved_ = false;        // RAII state tracking
    struct termios original_termios_{};  // For restoration

    // Static state for signal handling (CRITICAL for cleanup)
    static struct termios* s_original_termios_;
    static int s_tty_fd_;
    static void restore_terminal_on_signal(int sig);

public:
    Terminal();
    ~Terminal() override;

    // Delete copy operations to prevent double cleanup
    Terminal(const Terminal&) = delete;
    auto operator=(const Terminal&) -> Terminal& = delete;

    // IDisambiguator
    auto resolve(const DisambiguationRequest& request) -> Choice override;

    // ITerminal interface
    auto is_interactive() -> bool override;
    auto prompt_line(const std::string& question) -> std::string override;
    auto read_patch_text() -> std::string override;
    auto choose_patch_file(const std::vector<std::string>& paths) -> std::optional<size_t> override;
    auto confirm(const std::string& question) -> bool override;
    auto show_report(const PatchReport& report) -> void override;
    auto show_message(const std::string& message) -> void override;

protected:
    auto setup_raw_mode() -> bool;
    auto restore_terminal_state() -> void;
    auto display_screen(const Screen& screen) -> void;
    auto get_input_event() -> InputEvent;

    // One line of cooked input; false at end of input
    auto read_line(std::string& line) -> bool;

private:
    auto setup_signal_handlers() -> void;
    auto clear_screen() -> void;
    auto read_char() -> int;
    auto read_arrow_sequence() -> InputEvent;
    auto input_file() -> FILE*;
};

} // namespace anchorpatch
