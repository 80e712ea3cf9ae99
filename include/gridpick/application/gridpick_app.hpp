#pragma once

#include "gridpick/interfaces.hpp"
#include "gridpick/ui/multi_select.hpp"

#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace gridpick {

// Process exit codes
inline constexpr int EXIT_CODE_OK = 0;
inline constexpr int EXIT_CODE_CANCELLED = 1;
inline constexpr int EXIT_CODE_ERROR = 2;
inline constexpr int EXIT_CODE_NO_TERMINAL = 3;

struct Config {
    std::string input_file = "-";             // stdin by default
    std::vector<std::string> preselect;       // Items checked at start
    std::string load_selection_file;          // Seed the selection from this file
    std::string save_selection_file;          // Save the confirmed selection here
    std::string title = std::string(DEFAULT_TITLE);
    std::string theme = "auto";               // light, dark or auto
    bool list_only = false;                   // Print a columnar list and exit
    bool null_separated = false;              // NUL instead of newline between results
    bool show_help = false;
};

// Returns std::nullopt after reporting a usage error on err
auto parse_args(int argc, const char* const argv[], std::ostream& err) -> std::optional<Config>;
auto print_usage(std::ostream& out) -> void;

class GridpickApp {
private:
    std::unique_ptr<ITerminal> terminal_;

public:
    explicit GridpickApp(std::unique_ptr<ITerminal> terminal);

    auto run(const Config& config) -> int;

private:
    auto load_input_items(const Config& config) -> std::optional<std::vector<std::string>>;
    auto build_previous_selection(const Config& config) -> std::vector<std::string>;
    auto run_list(const std::vector<std::string>& items, const Theme& theme) -> int;
    auto run_interactive(std::vector<std::string> items, const Config& config, const Theme& theme)
        -> int;
    auto emit_selection(const std::vector<std::string>& selected, const Config& config) -> void;
};

} // namespace gridpick
