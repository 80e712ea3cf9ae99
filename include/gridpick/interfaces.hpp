#pragma once

#include <string_view>

namespace gridpick {

// Forward declarations
struct InputEvent;
struct TerminalSize;
enum class WriteStatus;

// Abstract terminal for dependency injection
class ITerminal {
public:
    virtual ~ITerminal() = default;

    // Alternate screen, raw input, hidden cursor. False leaves nothing to undo.
    virtual auto enter() -> bool = 0;
    // Restores the terminal. Idempotent.
    virtual auto exit() -> void = 0;
    // Blocks until a key, resize or end of input
    virtual auto read_event() -> InputEvent = 0;
    virtual auto size() -> TerminalSize = 0;
    virtual auto write(std::string_view data) -> WriteStatus = 0;
    virtual auto is_interactive() -> bool = 0;
};

} // namespace gridpick
