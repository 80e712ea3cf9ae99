#include "gridpick/ui/columnar_list.hpp"
#include "gridpick/core/text.hpp"

#include <ftxui/dom/elements.hpp>
#include <ftxui/dom/node.hpp>
#include <ftxui/screen/screen.hpp>

#include <algorithm>
#include <cerrno>

namespace gridpick {

auto format_list_row(std::span<const std::string> items, const ColumnLayout& layout, size_t row,
                     const Theme& theme, bool use_color) -> std::string {
    if (!use_color) {
        std::string line;
        for (size_t col = 0; col < layout.columns; ++col) {
            size_t index = row * layout.columns + col;
            if (index >= items.size()) {
                break;
            }
            const auto& item = items[index];
            line += item;
            auto width = text::display_width(item);
            if (width < layout.column_width) {
                line.append(layout.column_width - width, ' ');
            }
        }
        return line;
    }

    using namespace ftxui;

    Elements cells;
    for (size_t col = 0; col < layout.columns; ++col) {
        size_t index = row * layout.columns + col;
        if (index >= items.size()) {
            break;
        }
        // Alternate colours for better readability
        auto item_color = index % 2 == 0 ? theme.list_alt1 : theme.list_alt2;
        cells.push_back(text(items[index]) | color(item_color)
                        | size(WIDTH, EQUAL, static_cast<int>(layout.column_width)));
    }

    int width = static_cast<int>(std::max<size_t>(layout.columns * layout.column_width, 1));
    auto screen = Screen::Create(Dimension::Fixed(width), Dimension::Fixed(1));
    Render(screen, hbox(std::move(cells)));
    return screen.ToString();
}

auto print_columnar_list(std::ostream& out, std::span<const std::string> items,
                         const ColumnLayout& layout, const Theme& theme, bool use_color)
    -> WriteStatus {
    for (size_t row = 0; row < layout.rows; ++row) {
        errno = 0;
        out << format_list_row(items, layout, row, theme, use_color) << '\n';
        out.flush();
        if (out.fail()) {
            return errno == EPIPE ? WriteStatus::CLOSED : WriteStatus::FAILED;
        }
    }
    return WriteStatus::OK;
}

} // namespace gridpick
