#include "gridpick/io/selection_store.hpp"

#include <fstream>
#include <unordered_set>

namespace gridpick {

auto read_items(std::istream& input) -> std::vector<std::string> {
    std::vector<std::string> items;
    std::unordered_set<std::string> seen;
    std::string line;

    while (std::getline(input, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.empty()) continue;

        if (seen.insert(line).second) {
            items.push_back(line);
        }
    }

    return items;
}

auto load_items(const std::string& file_path) -> std::optional<std::vector<std::string>> {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        return std::nullopt;
    }
    return read_items(file);
}

auto save_selection(std::span<const std::string> selected, const std::string& file_path) -> bool {
    std::ofstream file(file_path);
    if (!file.is_open()) {
        return false;
    }

    for (const auto& item : selected) {
        file << item << "\n";
    }

    return file.good();
}

auto load_selection(const std::string& file_path) -> std::optional<std::vector<std::string>> {
    // Same format as an item list
    return load_items(file_path);
}

} // namespace gridpick
