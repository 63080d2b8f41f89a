#include "anchorpatch/ui/terminal.hpp"
#include <algorithm>
#include <cctype>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <sys/select.h>
#include <unistd.h>

namespace anchorpatch {

// Static members for signal handling
struct termios* Terminal::s_original_termios_ = nullptr;
int Terminal::s_tty_fd_ = -1;

Terminal::Terminal() {
    // Try to open /dev/tty for piped input support
    if (!isatty(STDIN_FILENO)) {
        tty_file_ = fopen("/dev/tty", "r+");
        if (tty_file_) {
            setbuf(tty_file_, nullptr); // Disable buffering
            use_tty_ = true;
        }
    }
}

Terminal::~Terminal() {
    restore_terminal_state();

    if (tty_file_) {
        fclose(tty_file_);
        tty_file_ = nullptr;
        use_tty_ = false;
    }
}

auto Terminal::resolve(const DisambiguationRequest& request) -> Choice {
    auto model = create_disambiguation_model(request);

    bool raw = setup_raw_mode();
    while (model.mode != ViewMode::DONE) {
        display_screen(compose_disambiguation_screen(model));
        model = update_disambiguation(model, get_input_event());
    }
    if (raw) {
        restore_terminal_state();
    }
    std::cout << "\n";

    return model.to_choice();
}

auto Terminal::is_interactive() -> bool { return isatty(STDIN_FILENO) || (use_tty_ && tty_file_); }

auto Terminal::prompt_line(const std::string& question) -> std::string {
    std::cout << question << " " << std::flush;
    std::string line;
    read_line(line);
    return line;
}

auto Terminal::read_patch_text() -> std::string {
    std::cout << "Paste the patch, then finish with a line containing only END (or Ctrl+D):\n"
              << std::flush;

    std::string text;
    std::string line;
    while (read_line(line)) {
        if (line == "END" || line == "END\r") {
            break;
        }
        text += line;
        text += '\n';
    }
    return text;
}

auto Terminal::choose_patch_file(const std::vector<std::string>& paths) -> std::optional<size_t> {
    std::cout << "Patch files found:\n";
    for (size_t i = 0; i < paths.size(); ++i) {
        std::cout << "  " << i + 1 << ". " << paths[i] << "\n";
    }
    std::cout << "  0. Paste patch text\n";

    while (true) {
        std::cout << "Choice [0-" << paths.size() << "]: " << std::flush;
        std::string line;
        if (!read_line(line)) {
            return std::nullopt;
        }

        if (line.empty() || line == "0") {
            return std::nullopt;
        }
        if (std::all_of(line.begin(), line.end(), [](unsigned char c) { return std::isdigit(c); })
            && line.size() < 10) {
            auto number = std::stoul(line);
            if (number >= 1 && number <= paths.size()) {
                return number - 1;
            }
        }
        std::cout << "Invalid choice.\n";
    }
}

auto Terminal::confirm(const std::string& question) -> bool {
    std::cout << question << " [y/N] " << std::flush;
    std::string line;
    if (!read_line(line)) {
        return false;
    }
    return line == "y" || line == "Y" || line == "yes" || line == "YES";
}

auto Terminal::show_report(const PatchReport& report) -> void {
    auto screen = compose_report_screen(report);
    for (const auto& line : screen.content) {
        if (line.is_highlighted) {
            std::cout << "\033[32m"; // Green
        }
        std::cout << line.text;
        if (line.is_highlighted) {
            std::cout << "\033[0m"; // Reset
        }
        std::cout << '\n';
    }
    std::cout << screen.status_line << "\n";
    std::cout.flush();
}

auto Terminal::show_message(const std::string& message) -> void {
    std::cout << message << "\n";
    std::cout.flush();
}

auto Terminal::setup_raw_mode() -> bool {
    FILE* terminal_file = input_file();
    if (!terminal_file) {
        return false;
    }

    int fd = fileno(terminal_file);
    if (tcgetattr(fd, &original_termios_) != 0) {
        return false;
    }

    termios_saved_ = true;

    // Setup static state for signal handler
    s_original_termios_ = &original_termios_;
    s_tty_fd_ = fd;

    // Register signal handlers for terminal restoration
    setup_signal_handlers();

    // Configure raw mode
    struct termios raw = original_termios_;
    raw.c_lflag &= ~(ECHO | ICANON); // Disable echo and canonical mode
    raw.c_cc[VMIN] = 1;              // Read at least 1 character
    raw.c_cc[VTIME] = 0;             // No timeout

    if (tcsetattr(fd, TCSAFLUSH, &raw) != 0) {
        termios_saved_ = false;
        return false;
    }

    return true;
}

auto Terminal::restore_terminal_state() -> void {
    if (termios_saved_) {
        FILE* terminal_file = input_file();
        if (terminal_file) {
            tcsetattr(fileno(terminal_file), TCSAFLUSH, &original_termios_);
        }
        termios_saved_ = false;
    }

    // Clear static state
    s_original_termios_ = nullptr;
    s_tty_fd_ = -1;
}

auto Terminal::display_screen(const Screen& screen) -> void {
    clear_screen();

    for (const auto& line : screen.content) {
        if (line.is_highlighted) {
            std::cout << "\033[32m"; // Green
        }
        std::cout << line.text;
        if (line.is_highlighted) {
            std::cout << "\033[0m"; // Reset
        }
        std::cout << '\n';
    }

    std::cout << "\n" << screen.status_line << "\n";
    std::cout << screen.control_hints << "\n> ";
    std::cout.flush();
}

auto Terminal::get_input_event() -> InputEvent {
    int ch = read_char();

    // End of input counts as a cancel request, so the loop cannot spin
    if (ch == EOF) {
        return InputEvent::QUIT;
    }

    // Handle arrow key sequences (ESC [ A/B)
    if (ch == 27) { // ESC
        return read_arrow_sequence();
    }

    return input_event_from_key(static_cast<char>(ch));
}

auto Terminal::read_line(std::string& line) -> bool {
    line.clear();
    FILE* file = input_file();
    if (!file) {
        return false;
    }

    int ch = EOF;
    while ((ch = fgetc(file)) != EOF) {
        if (ch == '\n') {
            return true;
        }
        line += static_cast<char>(ch);
    }
    return !line.empty();
}

void Terminal::restore_terminal_on_signal(int sig) {
    if (s_original_termios_ && s_tty_fd_ >= 0) {
        tcsetattr(s_tty_fd_, TCSAFLUSH, s_original_termios_);
    }
    std::signal(sig, SIG_DFL); // Restore default handler
    std::raise(sig);           // Re-raise signal
}

auto Terminal::setup_signal_handlers() -> void {
    std::signal(SIGINT, restore_terminal_on_signal);  // Ctrl+C
    std::signal(SIGTERM, restore_terminal_on_signal); // Termination
    std::signal(SIGQUIT, restore_terminal_on_signal); // Ctrl+backslash
    std::signal(SIGTSTP, restore_terminal_on_signal); // Ctrl+Z
}

auto Terminal::clear_screen() -> void {
    std::cout << "\033[2J\033[H"; // Clear screen and move cursor to top
}

auto Terminal::read_char() -> int {
    FILE* file = input_file();
    return file ? fgetc(file) : EOF;
}

auto Terminal::read_arrow_sequence() -> InputEvent {
    int fd = fileno(input_file());

    // Set a very short timeout to distinguish between ESC and arrow sequences
    fd_set read_fds;
    FD_ZERO(&read_fds);
    FD_SET(fd, &read_fds);

    struct timeval timeout;
    timeout.tv_sec = 0;
    timeout.tv_usec = 100000; // 100ms timeout

    int result = select(fd + 1, &read_fds, nullptr, nullptr, &timeout);

    if (result <= 0) {
        // Timeout or error - treat as standalone ESC
        return InputEvent::ESCAPE;
    }

    if (read_char() == '[') {
        switch (read_char()) {
        case 'A':
            return InputEvent::ARROW_UP;
        case 'B':
            return InputEvent::ARROW_DOWN;
        default:
            break;
        }
    }

    // Not a valid arrow sequence, treat as ESC
    return InputEvent::ESCAPE;
}

auto Terminal::input_file() -> FILE* { return use_tty_ ? tty_file_ : stdin; }

} // namespace anchorpatch
