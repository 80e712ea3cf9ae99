#include "gridpick/ui/multi_select.hpp"
#include "gridpick/ui/terminal_session.hpp"

namespace gridpick {

auto handle_key(SelectionState& state, const KeyEvent& key) -> SessionAction {
    if (key.kind == KeyKind::RELEASE) {
        return SessionAction::CONTINUE;
    }

    if (state.handle_search_key(key)) {
        return SessionAction::CONTINUE;
    }

    switch (key.code) {
    case KeyCode::ESCAPE:
        return SessionAction::CANCEL;
    case KeyCode::ENTER:
        return SessionAction::CONFIRM;
    case KeyCode::ARROW_UP:
        state.move_up();
        break;
    case KeyCode::ARROW_DOWN:
        state.move_down();
        break;
    case KeyCode::ARROW_LEFT:
        state.move_left();
        break;
    case KeyCode::ARROW_RIGHT:
        state.move_right();
        break;
    case KeyCode::PAGE_UP:
        state.page_up();
        break;
    case KeyCode::PAGE_DOWN:
        state.page_down();
        break;
    case KeyCode::HOME:
        state.move_home();
        break;
    case KeyCode::END:
        state.move_end();
        break;
    case KeyCode::CHARACTER:
        if (key.modifiers.control) {
            if (key.is_char('a')) {
                state.select_all();
            } else if (key.is_char('u')) {
                state.clear_all();
            }
            break;
        }
        if (!key.modifiers.none()) {
            break;
        }
        if (key.is_char('q')) {
            return SessionAction::CANCEL;
        }
        if (SelectionState::is_toggle_key(key)) {
            state.toggle_current();
        } else if (key.is_char('k')) {
            state.move_up();
        } else if (key.is_char('j')) {
            state.move_down();
        } else if (key.is_char('h')) {
            state.move_left();
        } else if (key.is_char('l')) {
            state.move_right();
        }
        break;
    default:
        break;
    }

    return SessionAction::CONTINUE;
}

auto select_items(ITerminal& terminal, std::vector<std::string> items,
                  std::span<const std::string> previous_selection, const SelectOptions& options)
    -> SelectionOutcome {
    if (items.empty()) {
        return SelectionOutcome{.status = SelectionStatus::CONFIRMED};
    }

    TerminalSession session(terminal);
    if (!session.active()) {
        return SelectionOutcome{.status = SelectionStatus::TERMINAL_UNAVAILABLE};
    }

    SelectionState state(std::move(items), [&terminal]() { return terminal.size(); });
    state.preselect(previous_selection);

    while (true) {
        auto layout = state.prepare_frame();
        auto frame = render_selection(state, layout, options.theme, options.title);
        auto status = paint(terminal, frame, terminal.size());
        if (status != WriteStatus::OK) {
            session.exit();
            return SelectionOutcome{.status = status == WriteStatus::CLOSED
                                                  ? SelectionStatus::OUTPUT_CLOSED
                                                  : SelectionStatus::OUTPUT_FAILED};
        }

        auto event = terminal.read_event();
        switch (event.type) {
        case EventType::RESIZE:
            state.invalidate_layout();
            continue;
        case EventType::END_OF_INPUT:
            session.exit();
            return SelectionOutcome{.status = SelectionStatus::INPUT_CLOSED};
        case EventType::KEY:
            break;
        }

        switch (handle_key(state, event.key)) {
        case SessionAction::CONTINUE:
            break;
        case SessionAction::CANCEL:
            session.exit();
            return SelectionOutcome{.status = SelectionStatus::CANCELLED};
        case SessionAction::CONFIRM:
            session.exit();
            return SelectionOutcome{.status = SelectionStatus::CONFIRMED,
                                    .selected = std::move(state).finish()};
        }
    }
}

} // namespace gridpick
