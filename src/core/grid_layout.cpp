#include "gridpick/core/grid_layout.hpp"
#include "gridpick/core/text.hpp"

#include <algorithm>

namespace gridpick {

auto compute_grid_layout(TerminalSize size, size_t max_item_width, size_t item_count)
    -> GridLayout {
    GridLayout layout;
    layout.column_width = max_item_width + CELL_DECORATION_WIDTH;

    size_t usable_width = size.width > 2 ? static_cast<size_t>(size.width - 2) : 0;
    layout.columns = std::max<size_t>(1, usable_width / layout.column_width);
    layout.columns = std::min(layout.columns, std::max<size_t>(item_count, 1));

    int rows = size.height - RESERVED_ROWS;
    layout.visible_rows = rows > 1 ? static_cast<size_t>(rows) : 1;

    return layout;
}

auto calculate_column_layout(std::span<const std::string> items, int terminal_width)
    -> ColumnLayout {
    ColumnLayout layout;

    size_t widest = 0;
    for (const auto& item : items) {
        widest = std::max(widest, text::display_width(item));
    }
    layout.column_width = widest + 2;

    size_t width = terminal_width > 0 ? static_cast<size_t>(terminal_width) : 0;
    layout.columns = std::max<size_t>(1, width / layout.column_width);
    layout.rows = (items.size() + layout.columns - 1) / layout.columns;

    return layout;
}

} // namespace gridpick
