#pragma once

#include <ftxui/screen/color.hpp>

#include <optional>
#include <string_view>

namespace gridpick {

enum class ThemeKind {
    LIGHT,
    DARK
};

// Colours used by the picker and the columnar listing.
// Passed by value to whatever draws; there is no process-wide theme.
struct Theme {
    ftxui::Color checkbox_selected;
    ftxui::Color checkbox_unselected;
    ftxui::Color item_selected_text;
    ftxui::Color item_unselected_text;
    ftxui::Color footer;
    ftxui::Color header_title;
    ftxui::Color header_hint;
    ftxui::Color list_alt1;
    ftxui::Color list_alt2;

    static auto light() -> Theme;
    static auto dark() -> Theme;
    static auto from_kind(ThemeKind kind) -> Theme;
};

// Guess the background from a COLORFGBG value such as "15;0" (fg;bg).
// Backgrounds 8 and above are light; anything else is dark.
auto detect_theme_kind(const char* colorfgbg) -> ThemeKind;
auto detect_theme_kind_from_env() -> ThemeKind;

auto parse_theme_kind(std::string_view name) -> std::optional<ThemeKind>;

} // namespace gridpick
