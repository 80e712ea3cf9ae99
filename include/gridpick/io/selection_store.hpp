#pragma once

#include <istream>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace gridpick {

// One item per line. Trailing CR is dropped, blank lines are skipped and only
// the first occurrence of a repeated line is kept.
auto read_items(std::istream& input) -> std::vector<std::string>;
auto load_items(const std::string& file_path) -> std::optional<std::vector<std::string>>;

// Selection persistence, one selected item per line
auto save_selection(std::span<const std::string> selected, const std::string& file_path) -> bool;
auto load_selection(const std::string& file_path) -> std::optional<std::vector<std::string>>;

} // namespace gridpick
