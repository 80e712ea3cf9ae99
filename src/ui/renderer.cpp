#include "gridpick/ui/renderer.hpp"

#include <ftxui/dom/node.hpp>
#include <ftxui/screen/screen.hpp>

#include <algorithm>

namespace gridpick {

namespace {

auto render_header(const SelectionState& state, const Theme& theme, std::string_view title)
    -> ftxui::Element {
    using namespace ftxui;

    auto title_line = hbox({
        text(std::string(title) + "  ") | bold | color(theme.header_title),
        text(std::string(KEY_HINT)) | color(theme.header_hint),
    });

    auto query_line = hbox({
        text(filter_line(state)) | color(theme.header_hint),
        text(std::string(FILTER_HINT)) | color(theme.header_hint),
    });

    return vbox({title_line, query_line});
}

auto render_cell(const SelectionState& state, size_t position, const GridLayout& layout,
                 const Theme& theme) -> ftxui::Element {
    using namespace ftxui;

    size_t item_index = state.filtered_indices()[position];
    bool is_cursor = state.cursor() == position;
    bool is_selected = state.is_selected(item_index);

    auto checkbox = text(is_selected ? "[x]" : "[ ]")
                    | color(is_selected ? theme.checkbox_selected : theme.checkbox_unselected);
    if (is_cursor) {
        // Only the checkbox is inverted, not the gap after it
        checkbox = checkbox | inverted;
    }

    auto name = text(state.items()[item_index])
                | color(is_selected ? theme.item_selected_text : theme.item_unselected_text)
                | size(WIDTH, EQUAL, static_cast<int>(layout.column_width - CELL_DECORATION_WIDTH));

    return hbox({checkbox, text(" "), name});
}

auto render_grid(const SelectionState& state, const GridLayout& layout, const Theme& theme)
    -> ftxui::Element {
    using namespace ftxui;

    if (state.filtered_indices().empty()) {
        return text(std::string(NO_MATCHES_MESSAGE)) | color(theme.header_hint);
    }

    Elements rows;
    for (size_t row = 0; row < layout.visible_rows; ++row) {
        Elements cells;
        for (size_t col = 0; col < layout.columns; ++col) {
            size_t position = state.viewport_offset() + row * layout.columns + col;
            if (position >= state.visible_count()) {
                break;
            }
            cells.push_back(render_cell(state, position, layout, theme));
        }
        if (cells.empty()) {
            break;
        }
        rows.push_back(hbox(std::move(cells)));
    }

    return vbox(std::move(rows));
}

} // namespace

auto filter_line(const SelectionState& state) -> std::string {
    std::string line = state.search_query().empty() ? "Filter: showing all items"
                                                    : "Filter: " + state.search_query();
    if (state.search_active()) {
        line += " _";
    }
    return line;
}

auto footer_line(const SelectionState& state) -> std::string {
    return "Selected " + std::to_string(state.selected_count()) + "/"
           + std::to_string(state.total_count()) + " · Showing "
           + std::to_string(state.visible_count()) + "/" + std::to_string(state.total_count())
           + " · Use arrows or hjkl to move, PgUp/PgDn to scroll";
}

auto render_selection(const SelectionState& state, const GridLayout& layout, const Theme& theme,
                      std::string_view title) -> ftxui::Element {
    using namespace ftxui;

    auto grid = render_grid(state, layout, theme)
                | size(HEIGHT, EQUAL, static_cast<int>(layout.visible_rows));
    auto footer = text(footer_line(state)) | color(theme.footer);

    return vbox({
        render_header(state, theme, title),
        grid,
        text(""),
        footer,
    });
}

auto paint(ITerminal& terminal, const ftxui::Element& element, TerminalSize size) -> WriteStatus {
    auto screen = ftxui::Screen::Create(ftxui::Dimension::Fixed(std::max(size.width, 1)),
                                        ftxui::Dimension::Fixed(std::max(size.height, 1)));
    ftxui::Render(screen, element);

    // Clear, home, then the frame
    std::string frame = "\033[2J\033[H";
    frame += screen.ToString();
    return terminal.write(frame);
}

} // namespace gridpick
