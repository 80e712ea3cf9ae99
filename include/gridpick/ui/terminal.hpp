#pragma once

#include "gridpick/interfaces.hpp"
#include "gridpick/types.hpp"

#include <csignal>
#include <cstdio>
#include <optional>
#include <string>
#include <termios.h>

namespace gridpick {

// The controlling terminal in raw, full-screen mode.
//
// When stdin or stdout is redirected (items piped in, result piped out) the
// terminal is reached through /dev/tty for both input and drawing.
class Terminal : public ITerminal {
private:
    FILE* tty_file_ = nullptr;          // /dev/tty for redirected stdin/stdout
    int input_fd_ = -1;
    int output_fd_ = -1;
    bool active_ = false;               // RAII state tracking
    struct termios original_termios_{};  // For restoration
    struct termios raw_termios_{};       // Re-applied after a job-control resume
    std::optional<unsigned char> pending_byte_;  // Read ahead while decoding ESC

    // Static state for signal handling (CRITICAL for cleanup)
    static struct termios* s_original_termios_;
    static struct termios* s_raw_termios_;
    static int s_tty_fd_;
    static int s_output_fd_;
    static volatile std::sig_atomic_t s_resize_pending_;
    static void restore_terminal_on_signal(int sig);
    static void note_resize(int sig);
    static void resume_after_stop(int sig);

public:
    Terminal();
    // Uses the given descriptors as they are; the caller keeps ownership
    Terminal(int input_fd, int output_fd);
    ~Terminal() override;

    // Delete copy operations to prevent double cleanup
    Terminal(const Terminal&) = delete;
    auto operator=(const Terminal&) -> Terminal& = delete;

    // ITerminal interface
    auto enter() -> bool override;
    auto exit() -> void override;
    auto read_event() -> InputEvent override;
    auto size() -> TerminalSize override;
    auto write(std::string_view data) -> WriteStatus override;
    auto is_interactive() -> bool override;

private:
    enum class ReadResult {
        BYTE,
        TIMEOUT,
        INTERRUPTED,
        CLOSED
    };

    auto setup_signal_handlers() -> void;
    auto restore_signal_handlers() -> void;
    auto read_byte(unsigned char& byte, int timeout_ms) -> ReadResult;
    auto read_escape_sequence() -> KeyEvent;
    auto read_csi_sequence() -> KeyEvent;
    auto read_utf8_character(unsigned char lead) -> std::string;
    auto decode_byte(unsigned char byte) -> KeyEvent;

    // Handlers displaced while the session is live, in HANDLED_SIGNALS order
    static constexpr size_t HANDLED_SIGNAL_COUNT = 8;
    struct sigaction saved_actions_[HANDLED_SIGNAL_COUNT]{};
};

} // namespace gridpick
