#include "gridpick/core/item_filter.hpp"
#include "gridpick/core/text.hpp"

#include <numeric>

namespace gridpick {

auto filter_items(std::span<const std::string> items, std::string_view query)
    -> std::vector<size_t> {
    if (query.empty()) {
        std::vector<size_t> all_indices(items.size());
        std::iota(all_indices.begin(), all_indices.end(), 0);
        return all_indices;
    }

    auto needle = text::to_lowercase(query);
    std::vector<size_t> filtered_indices;

    for (size_t i = 0; i < items.size(); ++i) {
        if (text::contains_ignore_case(items[i], needle)) {
            filtered_indices.push_back(i);
        }
    }

    return filtered_indices;
}

} // namespace gridpick
