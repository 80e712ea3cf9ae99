#include "gridpick/ui/terminal.hpp"

#include <ftxui/screen/terminal.hpp>

#include <cerrno>
#include <cstdlib>
#include <iterator>
#include <sys/ioctl.h>
#include <sys/select.h>
#include <unistd.h>

namespace gridpick {

namespace {

constexpr std::string_view ENTER_SEQUENCE = "\033[?1049h\033[?25l";  // Alt screen, hide cursor
constexpr std::string_view EXIT_SEQUENCE = "\033[?25h\033[?1049l";   // Show cursor, main screen

// Time allowed between ESC and the rest of an escape sequence
constexpr int ESCAPE_TIMEOUT_MS = 100;

// Order matches Terminal::saved_actions_
constexpr int HANDLED_SIGNALS[] = {SIGINT,   SIGTERM, SIGQUIT, SIGHUP,
                                   SIGTSTP, SIGCONT, SIGWINCH, SIGPIPE};

// Larger CSI parameters are never meaningful; stop accumulating before overflow
constexpr int CSI_PARAMETER_LIMIT = 10000;

auto write_all(int fd, std::string_view data) -> WriteStatus {
    while (!data.empty()) {
        auto written = ::write(fd, data.data(), data.size());
        if (written < 0) {
            if (errno == EINTR) {
                continue;
            }
            return errno == EPIPE ? WriteStatus::CLOSED : WriteStatus::FAILED;
        }
        data.remove_prefix(static_cast<size_t>(written));
    }
    return WriteStatus::OK;
}

auto modifiers_from_csi_parameter(int parameter) -> Modifiers {
    // xterm encodes modifiers as 1 + (shift | alt << 1 | ctrl << 2)
    Modifiers modifiers;
    if (parameter > 1) {
        int bits = parameter - 1;
        modifiers.shift = (bits & 1) != 0;
        modifiers.alt = (bits & 2) != 0;
        modifiers.control = (bits & 4) != 0;
    }
    return modifiers;
}

} // namespace

// Static members for signal handling
struct termios* Terminal::s_original_termios_ = nullptr;
struct termios* Terminal::s_raw_termios_ = nullptr;
int Terminal::s_tty_fd_ = -1;
int Terminal::s_output_fd_ = -1;
volatile std::sig_atomic_t Terminal::s_resize_pending_ = 0;

Terminal::Terminal() {
    input_fd_ = STDIN_FILENO;
    output_fd_ = STDOUT_FILENO;

    // Items piped in or the result piped out: talk to /dev/tty directly
    if (!isatty(STDIN_FILENO) || !isatty(STDOUT_FILENO)) {
        tty_file_ = fopen("/dev/tty", "r+");
        if (tty_file_) {
            setbuf(tty_file_, nullptr); // Disable buffering
            input_fd_ = fileno(tty_file_);
            output_fd_ = input_fd_;
        }
    }
}

Terminal::Terminal(int input_fd, int output_fd) : input_fd_(input_fd), output_fd_(output_fd) {}

Terminal::~Terminal() {
    exit();

    if (tty_file_) {
        fclose(tty_file_);
        tty_file_ = nullptr;
    }
}

auto Terminal::enter() -> bool {
    if (active_) {
        return true;
    }

    if (!isatty(input_fd_) || !isatty(output_fd_)) {
        return false;
    }

    if (tcgetattr(input_fd_, &original_termios_) != 0) {
        return false;
    }

    // Configure raw mode
    raw_termios_ = original_termios_;
    raw_termios_.c_lflag &= ~(ECHO | ICANON | IEXTEN); // Disable echo and canonical mode
    raw_termios_.c_iflag &= ~(IXON | ICRNL);           // Ctrl+S/Ctrl+Q reach us, Enter stays \r
    raw_termios_.c_cc[VMIN] = 1;                       // Read at least 1 character
    raw_termios_.c_cc[VTIME] = 0;                      // No timeout

    if (tcsetattr(input_fd_, TCSAFLUSH, &raw_termios_) != 0) {
        return false;
    }

    if (write_all(output_fd_, ENTER_SEQUENCE) != WriteStatus::OK) {
        tcsetattr(input_fd_, TCSAFLUSH, &original_termios_);
        return false;
    }

    // Setup static state for signal handler
    s_original_termios_ = &original_termios_;
    s_raw_termios_ = &raw_termios_;
    s_tty_fd_ = input_fd_;
    s_output_fd_ = output_fd_;
    s_resize_pending_ = 0;

    setup_signal_handlers();

    // Register atexit handler as final safety net
    static bool atexit_registered = false;
    if (!atexit_registered) {
        atexit_registered = true;
        std::atexit([]() {
            if (s_original_termios_ && s_tty_fd_ >= 0) {
                write_all(s_output_fd_, EXIT_SEQUENCE);
                tcsetattr(s_tty_fd_, TCSAFLUSH, s_original_termios_);
            }
        });
    }

    active_ = true;
    return true;
}

auto Terminal::exit() -> void {
    if (!active_) {
        return;
    }
    active_ = false;

    // Best effort: the reader may already be gone
    write_all(output_fd_, EXIT_SEQUENCE);
    tcsetattr(input_fd_, TCSAFLUSH, &original_termios_);

    // Clear static state before the handlers go back
    s_original_termios_ = nullptr;
    s_raw_termios_ = nullptr;
    s_tty_fd_ = -1;
    s_output_fd_ = -1;

    restore_signal_handlers();
}

auto Terminal::read_event() -> InputEvent {
    while (true) {
        if (s_resize_pending_) {
            s_resize_pending_ = 0;
            return InputEvent::resize();
        }

        unsigned char byte = 0;
        switch (read_byte(byte, -1)) {
        case ReadResult::BYTE:
            return InputEvent::from_key(decode_byte(byte));
        case ReadResult::INTERRUPTED:
        case ReadResult::TIMEOUT:
            continue;
        case ReadResult::CLOSED:
            return InputEvent::end_of_input();
        }
    }
}

auto Terminal::size() -> TerminalSize {
    struct winsize ws{};
    if (ioctl(output_fd_, TIOCGWINSZ, &ws) == 0 && ws.ws_col > 0 && ws.ws_row > 0) {
        return TerminalSize{.width = ws.ws_col, .height = ws.ws_row};
    }

    // FTXUI falls back to a conservative default when stdout is not a terminal
    auto dimensions = ftxui::Terminal::Size();
    return TerminalSize{.width = dimensions.dimx, .height = dimensions.dimy};
}

auto Terminal::write(std::string_view data) -> WriteStatus { return write_all(output_fd_, data); }

auto Terminal::is_interactive() -> bool { return isatty(input_fd_) && isatty(output_fd_); }

void Terminal::restore_terminal_on_signal(int sig) {
    if (s_original_termios_ && s_tty_fd_ >= 0) {
        write_all(s_output_fd_, EXIT_SEQUENCE);
        tcsetattr(s_tty_fd_, TCSAFLUSH, s_original_termios_);
    }
    std::signal(sig, SIG_DFL); // Restore default handler
    std::raise(sig);           // Re-raise signal
}

void Terminal::note_resize([[maybe_unused]] int sig) { s_resize_pending_ = 1; }

// Back from Ctrl+Z: the stop handler restored the terminal and dropped itself
void Terminal::resume_after_stop([[maybe_unused]] int sig) {
    if (s_raw_termios_ && s_tty_fd_ >= 0) {
        tcsetattr(s_tty_fd_, TCSAFLUSH, s_raw_termios_);
        write_all(s_output_fd_, ENTER_SEQUENCE);

        struct sigaction action{};
        sigemptyset(&action.sa_mask);
        action.sa_handler = restore_terminal_on_signal;
        sigaction(SIGTSTP, &action, nullptr);
    }
    s_resize_pending_ = 1; // Redraw the whole frame
}

auto Terminal::setup_signal_handlers() -> void {
    static_assert(std::size(HANDLED_SIGNALS) == HANDLED_SIGNAL_COUNT);

    for (size_t i = 0; i < std::size(HANDLED_SIGNALS); ++i) {
        struct sigaction action{};
        sigemptyset(&action.sa_mask);
        // No SA_RESTART: a resize has to interrupt the blocking read
        action.sa_flags = 0;

        switch (HANDLED_SIGNALS[i]) {
        case SIGWINCH:
            action.sa_handler = note_resize;
            break;
        case SIGCONT:
            action.sa_handler = resume_after_stop;
            break;
        case SIGPIPE:
            action.sa_handler = SIG_IGN; // Surfaces as EPIPE from write()
            break;
        default:
            action.sa_handler = restore_terminal_on_signal;
            break;
        }

        sigaction(HANDLED_SIGNALS[i], &action, &saved_actions_[i]);
    }
}

auto Terminal::restore_signal_handlers() -> void {
    for (size_t i = 0; i < std::size(HANDLED_SIGNALS); ++i) {
        sigaction(HANDLED_SIGNALS[i], &saved_actions_[i], nullptr);
    }
}

auto Terminal::read_byte(unsigned char& byte, int timeout_ms) -> ReadResult {
    if (pending_byte_) {
        byte = *pending_byte_;
        pending_byte_.reset();
        return ReadResult::BYTE;
    }

    if (timeout_ms >= 0) {
        fd_set read_fds;
        FD_ZERO(&read_fds);
        FD_SET(input_fd_, &read_fds);

        struct timeval timeout;
        timeout.tv_sec = 0;
        timeout.tv_usec = timeout_ms * 1000;

        int result = select(input_fd_ + 1, &read_fds, nullptr, nullptr, &timeout);
        if (result < 0) {
            return errno == EINTR ? ReadResult::INTERRUPTED : ReadResult::CLOSED;
        }
        if (result == 0) {
            return ReadResult::TIMEOUT;
        }
    }

    auto count = ::read(input_fd_, &byte, 1);
    if (count == 1) {
        return ReadResult::BYTE;
    }
    if (count < 0 && errno == EINTR) {
        return ReadResult::INTERRUPTED;
    }
    return ReadResult::CLOSED;
}

auto Terminal::decode_byte(unsigned char byte) -> KeyEvent {
    switch (byte) {
    case 27:
        return read_escape_sequence();
    case '\r':
    case '\n':
        return KeyEvent::key(KeyCode::ENTER);
    case '\t':
        return KeyEvent::key(KeyCode::TAB);
    case 127:
    case 8:
        return KeyEvent::key(KeyCode::BACKSPACE);
    default:
        break;
    }

    // Ctrl+A .. Ctrl+Z
    if (byte >= 1 && byte <= 26) {
        return KeyEvent::ctrl(static_cast<char>('a' + byte - 1));
    }

    if (byte < 0x20) {
        return KeyEvent::key(KeyCode::UNKNOWN);
    }

    if (byte >= 0x80) {
        return KeyEvent::text(read_utf8_character(byte));
    }

    auto key = KeyEvent::text(std::string(1, static_cast<char>(byte)));
    key.modifiers.shift = byte >= 'A' && byte <= 'Z';
    return key;
}

auto Terminal::read_escape_sequence() -> KeyEvent {
    // A lone ESC and the start of a sequence look the same; wait briefly
    unsigned char next = 0;
    if (read_byte(next, ESCAPE_TIMEOUT_MS) != ReadResult::BYTE) {
        return KeyEvent::key(KeyCode::ESCAPE);
    }

    if (next == '[') {
        return read_csi_sequence();
    }

    if (next == 'O') {
        unsigned char final_byte = 0;
        if (read_byte(final_byte, ESCAPE_TIMEOUT_MS) != ReadResult::BYTE) {
            return KeyEvent::key(KeyCode::UNKNOWN);
        }
        switch (final_byte) {
        case 'A': return KeyEvent::key(KeyCode::ARROW_UP);
        case 'B': return KeyEvent::key(KeyCode::ARROW_DOWN);
        case 'C': return KeyEvent::key(KeyCode::ARROW_RIGHT);
        case 'D': return KeyEvent::key(KeyCode::ARROW_LEFT);
        case 'H': return KeyEvent::key(KeyCode::HOME);
        case 'F': return KeyEvent::key(KeyCode::END);
        default: return KeyEvent::key(KeyCode::UNKNOWN);
        }
    }

    // ESC followed by a character is Alt+character
    if (next >= 0x20 && next != 127) {
        auto key = decode_byte(next);
        key.modifiers.alt = true;
        return key;
    }

    // A second ESC or a control key typed quickly is its own event
    pending_byte_ = next;
    return KeyEvent::key(KeyCode::ESCAPE);
}

auto Terminal::read_csi_sequence() -> KeyEvent {
    // ESC [ <params> <final>, params are digits separated by ';'
    int parameters[2] = {0, 0};
    size_t parameter_index = 0;
    unsigned char byte = 0;

    while (true) {
        if (read_byte(byte, ESCAPE_TIMEOUT_MS) != ReadResult::BYTE) {
            return KeyEvent::key(KeyCode::UNKNOWN);
        }
        if (byte >= '0' && byte <= '9') {
            if (parameter_index < 2 && parameters[parameter_index] < CSI_PARAMETER_LIMIT) {
                parameters[parameter_index] = parameters[parameter_index] * 10 + (byte - '0');
            }
        } else if (byte == ';') {
            ++parameter_index;
        } else if (byte >= 0x40 && byte <= 0x7E) {
            break;
        }
    }

    KeyEvent key;
    switch (byte) {
    case 'A': key.code = KeyCode::ARROW_UP; break;
    case 'B': key.code = KeyCode::ARROW_DOWN; break;
    case 'C': key.code = KeyCode::ARROW_RIGHT; break;
    case 'D': key.code = KeyCode::ARROW_LEFT; break;
    case 'H': key.code = KeyCode::HOME; break;
    case 'F': key.code = KeyCode::END; break;
    case '~':
        switch (parameters[0]) {
        case 1:
        case 7: key.code = KeyCode::HOME; break;
        case 3: key.code = KeyCode::DELETE; break;
        case 4:
        case 8: key.code = KeyCode::END; break;
        case 5: key.code = KeyCode::PAGE_UP; break;
        case 6: key.code = KeyCode::PAGE_DOWN; break;
        default: key.code = KeyCode::UNKNOWN; break;
        }
        break;
    default:
        key.code = KeyCode::UNKNOWN;
        break;
    }

    key.modifiers = modifiers_from_csi_parameter(parameters[1]);
    return key;
}

auto Terminal::read_utf8_character(unsigned char lead) -> std::string {
    std::string character(1, static_cast<char>(lead));

    size_t continuation = 0;
    if ((lead & 0xE0) == 0xC0) {
        continuation = 1;
    } else if ((lead & 0xF0) == 0xE0) {
        continuation = 2;
    } else if ((lead & 0xF8) == 0xF0) {
        continuation = 3;
    }

    for (size_t i = 0; i < continuation; ++i) {
        unsigned char byte = 0;
        if (read_byte(byte, ESCAPE_TIMEOUT_MS) != ReadResult::BYTE) {
            break;
        }
        character.push_back(static_cast<char>(byte));
    }

    return character;
}

} // namespace gridpick
