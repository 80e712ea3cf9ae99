#include "gridpick/ui/terminal_session.hpp"

namespace gridpick {

TerminalSession::TerminalSession(ITerminal& terminal) : terminal_(terminal) {
    active_ = terminal_.enter();
}

TerminalSession::~TerminalSession() { exit(); }

auto TerminalSession::exit() -> void {
    if (active_) {
        active_ = false;
        terminal_.exit();
    }
}

} // namespace gridpick
