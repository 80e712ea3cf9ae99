#pragma once

#include <string>
#include <string_view>

namespace gridpick::text {

// Lower-cases every code point, not just ASCII
auto to_lowercase(std::string_view text) -> std::string;

auto contains_ignore_case(std::string_view haystack, std::string_view lowered_needle) -> bool;

// Width in terminal cells (wide and combining characters accounted for)
auto display_width(const std::string& text) -> size_t;

// Removes the last UTF-8 code point. No-op on an empty string.
auto pop_last_codepoint(std::string& text) -> void;

// C0, DEL and C1 control characters
auto is_control_character(std::string_view codepoint) -> bool;

} // namespace gridpick::text
