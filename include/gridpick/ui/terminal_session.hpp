#pragma once

#include "gridpick/interfaces.hpp"

namespace gridpick {

// Scoped ownership of a live terminal session.
//
// The constructor enters the terminal; the destructor restores it, so every
// path out of the owning scope (return, exception) leaves the terminal as it
// was found. exit() restores early and is safe to call any number of times.
class TerminalSession {
public:
    explicit TerminalSession(ITerminal& terminal);
    ~TerminalSession();

    TerminalSession(const TerminalSession&) = delete;
    auto operator=(const TerminalSession&) -> TerminalSession& = delete;

    // False when the terminal could not be entered; nothing needs undoing then
    auto active() const -> bool { return active_; }
    auto exit() -> void;

private:
    ITerminal& terminal_;
    bool active_ = false;
};

} // namespace gridpick
