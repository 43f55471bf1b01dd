// Launch-TOML entry point: extracts process types from a buildpack launch.toml
#include <launch-toml/cli/cli.hpp>

#include <iostream>
#include <string>
#include <vector>

int main(int argc, char* argv[]) {
    std::vector<std::string> args(argv, argv + argc);
    auto cfg = launchtoml::load_cli_config();
    return launchtoml::run_cli(args, std::cout, std::cerr, cfg);
}
