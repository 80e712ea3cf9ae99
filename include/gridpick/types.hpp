#pragma once

#include <string>
#include <utility>

namespace gridpick {

// Terminal dimensions in cells
struct TerminalSize {
    int width = 80;
    int height = 24;

    auto operator==(const TerminalSize& other) const -> bool = default;
};

// Keys the picker distinguishes
enum class KeyCode {
    CHARACTER,   // Printable or control-modified character, see KeyEvent::character
    ENTER,
    ESCAPE,
    BACKSPACE,
    DELETE,
    TAB,
    ARROW_UP,
    ARROW_DOWN,
    ARROW_LEFT,
    ARROW_RIGHT,
    PAGE_UP,
    PAGE_DOWN,
    HOME,
    END,
    UNKNOWN
};

enum class KeyKind {
    PRESS,
    RELEASE
};

struct Modifiers {
    bool shift = false;
    bool control = false;
    bool alt = false;

    auto none() const -> bool { return !shift && !control && !alt; }
    auto shift_only() const -> bool { return shift && !control && !alt; }

    auto operator==(const Modifiers& other) const -> bool = default;
};

struct KeyEvent {
    KeyCode code = KeyCode::UNKNOWN;
    std::string character;  // One UTF-8 code point when code == CHARACTER
    Modifiers modifiers;
    KeyKind kind = KeyKind::PRESS;

    static auto key(KeyCode code) -> KeyEvent { return KeyEvent{.code = code}; }

    static auto text(std::string ch) -> KeyEvent
    {
        return KeyEvent{.code = KeyCode::CHARACTER, .character = std::move(ch)};
    }

    static auto ctrl(char letter) -> KeyEvent
    {
        return KeyEvent{.code = KeyCode::CHARACTER,
                        .character = std::string(1, letter),
                        .modifiers = Modifiers{.control = true}};
    }

    auto is_char(char ch) const -> bool
    {
        return code == KeyCode::CHARACTER && character.size() == 1 && character[0] == ch;
    }
};

enum class EventType {
    KEY,
    RESIZE,
    END_OF_INPUT
};

// One event delivered by the terminal
struct InputEvent {
    EventType type = EventType::KEY;
    KeyEvent key;

    static auto from_key(KeyEvent key) -> InputEvent
    {
        return InputEvent{.type = EventType::KEY, .key = std::move(key)};
    }
    static auto resize() -> InputEvent { return InputEvent{.type = EventType::RESIZE}; }
    static auto end_of_input() -> InputEvent { return InputEvent{.type = EventType::END_OF_INPUT}; }
};

// Result of writing a frame to the terminal
enum class WriteStatus {
    OK,
    CLOSED,  // Reader went away (EPIPE)
    FAILED
};

} // namespace gridpick
