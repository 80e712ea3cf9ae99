#include "gridpick/application/gridpick_app.hpp"
#include "gridpick/core/grid_layout.hpp"
#include "gridpick/io/selection_store.hpp"
#include "gridpick/ui/columnar_list.hpp"
#include "gridpick/ui/theme.hpp"

#include <iostream>
#include <unistd.h>

namespace gridpick {

auto print_usage(std::ostream& out) -> void {
    out << "Usage: gridpick [options] [FILE]\n";
    out << "Pick items (one per line, from FILE or stdin) in an interactive grid.\n\n";
    out << "  -i, --input <file>          Read items from file ('-' for stdin)\n";
    out << "  -p, --preselect <item>      Start with item checked (repeatable)\n";
    out << "      --load-selection <file> Start with the items listed in file checked\n";
    out << "      --save-selection <file> Write the confirmed selection to file\n";
    out << "  -t, --title <text>          Header title\n";
    out << "      --theme <light|dark|auto>  Colour theme (default: auto)\n";
    out << "  -l, --list                  Print items in columns and exit\n";
    out << "  -0, --null                  Separate selected items with NUL\n";
    out << "  -h, --help                  Show this help\n";
    out << "\nKeys: Space toggle, Enter confirm, Esc/q cancel, / or any letter to filter,\n";
    out << "      arrows/hjkl move, PgUp/PgDn/Home/End, Ctrl+A select all, Ctrl+U clear\n";
    out << "\nExit status: 0 confirmed, 1 cancelled, 2 error, 3 no terminal\n";
}

auto parse_args(int argc, const char* const argv[], std::ostream& err) -> std::optional<Config> {
    Config config;
    bool have_positional = false;

    auto take_value = [&](int& i, const std::string& option) -> std::optional<std::string> {
        if (i + 1 >= argc) {
            err << "Error: " << option << " requires a value\n";
            return std::nullopt;
        }
        return std::string(argv[++i]);
    };

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            config.show_help = true;
        } else if (arg == "-l" || arg == "--list") {
            config.list_only = true;
        } else if (arg == "-0" || arg == "--null") {
            config.null_separated = true;
        } else if (arg == "-i" || arg == "--input") {
            auto value = take_value(i, arg);
            if (!value) return std::nullopt;
            config.input_file = *value;
        } else if (arg == "-p" || arg == "--preselect") {
            auto value = take_value(i, arg);
            if (!value) return std::nullopt;
            config.preselect.push_back(*value);
        } else if (arg == "--load-selection") {
            auto value = take_value(i, arg);
            if (!value) return std::nullopt;
            config.load_selection_file = *value;
        } else if (arg == "--save-selection") {
            auto value = take_value(i, arg);
            if (!value) return std::nullopt;
            config.save_selection_file = *value;
        } else if (arg == "-t" || arg == "--title") {
            auto value = take_value(i, arg);
            if (!value) return std::nullopt;
            config.title = *value;
        } else if (arg == "--theme") {
            auto value = take_value(i, arg);
            if (!value) return std::nullopt;
            if (*value != "light" && *value != "dark" && *value != "auto") {
                err << "Error: unknown theme '" << *value << "' (expected light, dark or auto)\n";
                return std::nullopt;
            }
            config.theme = *value;
        } else if (arg != "-" && arg.starts_with("-")) {
            err << "Error: unknown option '" << arg << "'\n";
            return std::nullopt;
        } else if (!have_positional) {
            config.input_file = arg;
            have_positional = true;
        } else {
            err << "Error: unexpected argument '" << arg << "'\n";
            return std::nullopt;
        }
    }

    return config;
}

GridpickApp::GridpickApp(std::unique_ptr<ITerminal> terminal) : terminal_(std::move(terminal)) {}

auto GridpickApp::run(const Config& config) -> int {
    auto items = load_input_items(config);
    if (!items) {
        std::cerr << "Error: Could not read items from " << config.input_file << "\n";
        return EXIT_CODE_ERROR;
    }

    if (items->empty()) {
        std::cerr << "No items to select.\n";
        return EXIT_CODE_OK;
    }

    auto theme = Theme::from_kind(parse_theme_kind(config.theme).value_or(ThemeKind::DARK));

    if (config.list_only) {
        return run_list(*items, theme);
    }

    return run_interactive(std::move(*items), config, theme);
}

auto GridpickApp::load_input_items(const Config& config)
    -> std::optional<std::vector<std::string>> {
    if (config.input_file == "-") {
        return read_items(std::cin);
    }
    return load_items(config.input_file);
}

auto GridpickApp::build_previous_selection(const Config& config) -> std::vector<std::string> {
    std::vector<std::string> previous = config.preselect;

    if (!config.load_selection_file.empty()) {
        if (auto loaded = load_selection(config.load_selection_file)) {
            previous.insert(previous.end(), loaded->begin(), loaded->end());
        } else {
            std::cerr << "Warning: Could not load selection from " << config.load_selection_file
                      << "\n";
        }
    }

    return previous;
}

auto GridpickApp::run_list(const std::vector<std::string>& items, const Theme& theme) -> int {
    auto layout = calculate_column_layout(items, terminal_->size().width);
    bool use_color = isatty(STDOUT_FILENO);

    auto status = print_columnar_list(std::cout, items, layout, theme, use_color);
    if (status == WriteStatus::FAILED) {
        std::cerr << "Error: Failed to write the item list\n";
        return EXIT_CODE_ERROR;
    }

    // A closed pipe (e.g. `gridpick -l | head`) is a normal way to stop
    return EXIT_CODE_OK;
}

auto GridpickApp::run_interactive(std::vector<std::string> items, const Config& config,
                                  const Theme& theme) -> int {
    if (!terminal_->is_interactive()) {
        std::cerr << "Error: gridpick needs an interactive terminal\n";
        return EXIT_CODE_NO_TERMINAL;
    }

    auto previous = build_previous_selection(config);
    SelectOptions options{.title = config.title, .theme = theme};

    auto outcome = select_items(*terminal_, std::move(items), previous, options);

    switch (outcome.status) {
    case SelectionStatus::CONFIRMED:
        if (outcome.selected.empty()) {
            std::cerr << "No items selected.\n";
            return EXIT_CODE_OK;
        }
        emit_selection(outcome.selected, config);
        return EXIT_CODE_OK;

    case SelectionStatus::CANCELLED:
    case SelectionStatus::OUTPUT_CLOSED:
        return EXIT_CODE_CANCELLED;

    case SelectionStatus::TERMINAL_UNAVAILABLE:
        std::cerr << "Error: Failed to set up the terminal for interactive selection\n";
        return EXIT_CODE_NO_TERMINAL;

    case SelectionStatus::OUTPUT_FAILED:
        std::cerr << "Error: Failed to draw to the terminal\n";
        return EXIT_CODE_ERROR;

    case SelectionStatus::INPUT_CLOSED:
        std::cerr << "Error: Terminal input closed before a selection was made\n";
        return EXIT_CODE_ERROR;
    }

    return EXIT_CODE_ERROR;
}

auto GridpickApp::emit_selection(const std::vector<std::string>& selected, const Config& config)
    -> void {
    char separator = config.null_separated ? '\0' : '\n';
    for (const auto& item : selected) {
        std::cout << item << separator;
    }
    std::cout.flush();

    if (!config.save_selection_file.empty()) {
        if (save_selection(selected, config.save_selection_file)) {
            std::cerr << "Saved " << selected.size() << " items to " << config.save_selection_file
                      << "\n";
        } else {
            std::cerr << "Warning: Could not save selection to " << config.save_selection_file
                      << "\n";
        }
    }
}

} // namespace gridpick
