#pragma once

#include "gridpick/types.hpp"

#include <span>
#include <string>

namespace gridpick {

// Padding around each cell: "[x] " before the text plus trailing gap
inline constexpr size_t CELL_DECORATION_WIDTH = 4;

// Lines the picker keeps for itself: two header lines, a blank, the footer
// and one line of margin
inline constexpr int RESERVED_ROWS = 5;

// Geometry of the interactive grid
struct GridLayout {
    size_t columns = 1;
    size_t column_width = CELL_DECORATION_WIDTH;
    size_t visible_rows = 1;

    auto page_capacity() const -> size_t { return columns * visible_rows; }

    auto operator==(const GridLayout& other) const -> bool = default;
};

auto compute_grid_layout(TerminalSize size, size_t max_item_width, size_t item_count)
    -> GridLayout;

// Geometry of the non-interactive columnar listing
struct ColumnLayout {
    size_t columns = 1;
    size_t column_width = 0;
    size_t rows = 0;
};

auto calculate_column_layout(std::span<const std::string> items, int terminal_width)
    -> ColumnLayout;

} // namespace gridpick
