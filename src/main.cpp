#include "gridpick/application/gridpick_app.hpp"
#include "gridpick/ui/terminal.hpp"

#include <csignal>
#include <iostream>
#include <memory>

int main(int argc, char* argv[]) {
    // Closed pipes surface as write errors instead of killing the process
    std::signal(SIGPIPE, SIG_IGN);

    auto config = gridpick::parse_args(argc, argv, std::cerr);
    if (!config) {
        gridpick::print_usage(std::cerr);
        return gridpick::EXIT_CODE_ERROR;
    }

    if (config->show_help) {
        gridpick::print_usage(std::cout);
        return gridpick::EXIT_CODE_OK;
    }

    gridpick::GridpickApp app(std::make_unique<gridpick::Terminal>());
    return app.run(*config);
}
