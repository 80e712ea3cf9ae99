#pragma once

#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace gridpick {

// Canonical indices of the items containing query, case-insensitively,
// in original order. An empty query matches every item.
auto filter_items(std::span<const std::string> items, std::string_view query)
    -> std::vector<size_t>;

} // namespace gridpick
