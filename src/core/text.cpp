#include "gridpick/core/text.hpp"

#include <ftxui/screen/string.hpp>

#include <algorithm>
#include <cctype>
#include <locale>
#include <stdexcept>

namespace gridpick::text {

namespace {

// Locale whose wide ctype knows the Unicode case mappings
auto utf8_locale() -> const std::locale& {
    static const std::locale locale = []() {
        for (const char* name : {"C.UTF-8", "C.utf8", "en_US.UTF-8"}) {
            try {
                return std::locale(name);
            } catch (const std::runtime_error&) {
                // Not installed here, try the next one
            }
        }
        return std::locale::classic();
    }();
    return locale;
}

auto is_ascii(std::string_view text) -> bool {
    return std::all_of(text.begin(), text.end(),
                       [](char c) { return static_cast<unsigned char>(c) < 0x80; });
}

} // namespace

auto to_lowercase(std::string_view text) -> std::string {
    std::string result{text};
    if (is_ascii(text)) {
        std::transform(result.begin(), result.end(), result.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return result;
    }

    std::wstring wide = ftxui::to_wstring(result);
    const auto& ctype = std::use_facet<std::ctype<wchar_t>>(utf8_locale());
    ctype.tolower(wide.data(), wide.data() + wide.size());
    return ftxui::to_string(wide);
}

auto contains_ignore_case(std::string_view haystack, std::string_view lowered_needle) -> bool {
    if (lowered_needle.empty()) {
        return true;
    }
    return to_lowercase(haystack).find(lowered_needle) != std::string::npos;
}

auto display_width(const std::string& text) -> size_t {
    int width = ftxui::string_width(text);
    return width > 0 ? static_cast<size_t>(width) : 0;
}

auto pop_last_codepoint(std::string& text) -> void {
    if (text.empty()) {
        return;
    }
    // Drop continuation bytes (10xxxxxx), then the lead byte
    while (text.size() > 1 && (static_cast<unsigned char>(text.back()) & 0xC0) == 0x80) {
        text.pop_back();
    }
    text.pop_back();
}

auto is_control_character(std::string_view codepoint) -> bool {
    if (codepoint.empty()) {
        return true;
    }
    auto lead = static_cast<unsigned char>(codepoint[0]);
    if (lead < 0x20 || lead == 0x7F) {
        return true;
    }
    // U+0080..U+009F encode as C2 80..C2 9F
    if (lead == 0xC2 && codepoint.size() >= 2) {
        auto next = static_cast<unsigned char>(codepoint[1]);
        return next >= 0x80 && next <= 0x9F;
    }
    return false;
}

} // namespace gridpick::text
