#include "gridpick/ui/theme.hpp"

#include <charconv>
#include <cstdlib>
#include <string>
#include <system_error>

namespace gridpick {

auto Theme::light() -> Theme {
    using ftxui::Color;
    return Theme{
        .checkbox_selected = Color::Green,
        .checkbox_unselected = Color::GrayDark,
        .item_selected_text = Color::Black,
        .item_unselected_text = Color::Black,
        .footer = Color::Blue,
        .header_title = Color::Blue,
        .header_hint = Color::GrayDark,
        .list_alt1 = Color::Black,
        .list_alt2 = Color::GrayDark,
    };
}

auto Theme::dark() -> Theme {
    using ftxui::Color;
    return Theme{
        .checkbox_selected = Color::GreenLight,
        .checkbox_unselected = Color::GrayDark,
        .item_selected_text = Color::White,
        .item_unselected_text = Color::White,
        .footer = Color::White,
        .header_title = Color::White,
        .header_hint = Color::GrayDark,
        .list_alt1 = Color::White,
        .list_alt2 = Color::GrayLight,
    };
}

auto Theme::from_kind(ThemeKind kind) -> Theme {
    switch (kind) {
    case ThemeKind::LIGHT:
        return light();
    case ThemeKind::DARK:
        return dark();
    }
    return dark();
}

auto detect_theme_kind(const char* colorfgbg) -> ThemeKind {
    if (colorfgbg == nullptr) {
        return ThemeKind::DARK;
    }

    // Background is the last component
    std::string value{colorfgbg};
    auto separator = value.rfind(';');
    auto background = separator == std::string::npos ? value : value.substr(separator + 1);

    int code = 0;
    auto [end, error] = std::from_chars(background.data(), background.data() + background.size(), code);
    if (error != std::errc{} || end != background.data() + background.size() || background.empty()) {
        return ThemeKind::DARK;
    }

    return code >= 8 ? ThemeKind::LIGHT : ThemeKind::DARK;
}

auto detect_theme_kind_from_env() -> ThemeKind {
    return detect_theme_kind(std::getenv("COLORFGBG"));
}

auto parse_theme_kind(std::string_view name) -> std::optional<ThemeKind> {
    if (name == "light") return ThemeKind::LIGHT;
    if (name == "dark") return ThemeKind::DARK;
    if (name == "auto") return detect_theme_kind_from_env();
    return std::nullopt;
}

} // namespace gridpick
