#include <iostream>
#include <vector>
#include <string>
#include "cli/claspalt_cli.hpp"
#include "cli/theme.hpp"
#include <core/settings.hpp>

int main(int argc, char** argv) {
    try {
        auto settings = load_settings();
        if (settings.is_err()) {
            std::cerr << theme::fail(settings.error);
            return 1;
        }

        std::vector<std::string> args(argv + 1, argv + argc);
        ClaspaltCLI cli(settings.value);
        return cli.run(args);
    } catch (const std::exception& e) {
        std::cerr << theme::fail(std::string(e.what()));
        return 1;
    }
}
