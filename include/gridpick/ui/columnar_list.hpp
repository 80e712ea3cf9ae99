#pragma once

#include "gridpick/core/grid_layout.hpp"
#include "gridpick/types.hpp"
#include "gridpick/ui/theme.hpp"

#include <ostream>
#include <span>
#include <string>

namespace gridpick {

// One row of the listing, padded to the column width. Colours alternate per
// item when use_color is set.
auto format_list_row(std::span<const std::string> items, const ColumnLayout& layout, size_t row,
                     const Theme& theme, bool use_color) -> std::string;

// Prints items in row-major columns. A closed stdout (EPIPE) ends the listing
// early and is reported as CLOSED rather than FAILED.
auto print_columnar_list(std::ostream& out, std::span<const std::string> items,
                         const ColumnLayout& layout, const Theme& theme, bool use_color)
    -> WriteStatus;

} // namespace gridpick
