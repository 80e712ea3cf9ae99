#pragma once

#include "gridpick/core/grid_layout.hpp"
#include "gridpick/core/selection_state.hpp"
#include "gridpick/interfaces.hpp"
#include "gridpick/types.hpp"
#include "gridpick/ui/theme.hpp"

#include <ftxui/dom/elements.hpp>

#include <string>
#include <string_view>

namespace gridpick {

inline constexpr std::string_view DEFAULT_TITLE = "Select items";
inline constexpr std::string_view KEY_HINT =
    "Space=toggle  Enter=confirm  Esc=cancel  Ctrl+A=all  Ctrl+U=clear";
inline constexpr std::string_view FILTER_HINT = "  (/ to focus, type to filter, Delete clears)";
inline constexpr std::string_view NO_MATCHES_MESSAGE = "No items match the current filter.";

// Header, grid and footer for the current state. Does not modify the state;
// call SelectionState::prepare_frame() for the layout first.
auto render_selection(const SelectionState& state, const GridLayout& layout, const Theme& theme,
                      std::string_view title) -> ftxui::Element;

// Text pieces, exposed for tests
auto filter_line(const SelectionState& state) -> std::string;
auto footer_line(const SelectionState& state) -> std::string;

// Rasterises element at the terminal's size and writes it out
auto paint(ITerminal& terminal, const ftxui::Element& element, TerminalSize size) -> WriteStatus;

} // namespace gridpick
