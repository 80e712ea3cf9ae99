#pragma once

#include "gridpick/core/selection_state.hpp"
#include "gridpick/interfaces.hpp"
#include "gridpick/types.hpp"
#include "gridpick/ui/renderer.hpp"
#include "gridpick/ui/theme.hpp"

#include <span>
#include <string>
#include <vector>

namespace gridpick {

struct SelectOptions {
    std::string title = std::string(DEFAULT_TITLE);
    Theme theme = Theme::dark();
};

enum class SelectionStatus {
    CONFIRMED,
    CANCELLED,             // User backed out; no changes requested
    TERMINAL_UNAVAILABLE,  // Could not enter raw/alternate mode
    OUTPUT_CLOSED,         // Drawing stopped because the reader went away
    OUTPUT_FAILED,         // Any other write error while drawing
    INPUT_CLOSED           // Terminal input ended before a decision
};

struct SelectionOutcome {
    SelectionStatus status = SelectionStatus::CANCELLED;
    std::vector<std::string> selected;  // Ascending original order, CONFIRMED only
};

// What the driving loop should do after a key
enum class SessionAction {
    CONTINUE,
    CONFIRM,
    CANCEL
};

// Routes one key press through search handling and then the command table
auto handle_key(SelectionState& state, const KeyEvent& key) -> SessionAction;

// Runs the interactive picker until the user confirms or cancels.
// The terminal is restored before this returns, on every path.
auto select_items(ITerminal& terminal, std::vector<std::string> items,
                  std::span<const std::string> previous_selection,
                  const SelectOptions& options = {}) -> SelectionOutcome;

} // namespace gridpick
