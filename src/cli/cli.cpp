/*
 * Launch-TOML command line front end
 * Copyright (c) 2025 iDev srl
 * Description: See header for details.
 */
#include <launch-toml/cli/cli.hpp>
#include <launch-toml/model/process_map.hpp>
#include <launch-toml/output/yaml.hpp>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <iostream>
#include <system_error>

namespace launchtoml {

static std::string getenv_or(const char* k, const std::string& def = "") { const char* v = std::getenv(k); return v ? std::string(v) : def; }
static bool truthy(const std::string& v) { return v == "1" || v == "true" || v == "on"; }

CliConfig load_cli_config() {
    CliConfig cfg;
    cfg.debug = truthy(getenv_or("LAUNCH_TOML_DEBUG"));
    std::string prog = getenv_or("LAUNCH_TOML_PROG");
    if (!prog.empty()) cfg.prog_name = prog;
    return cfg;
}

std::string usage_text(const CliConfig& cfg) {
    return "Usage: " + cfg.prog_name + " <launch.toml> [--yaml|--process <type>]";
}

static int run_mode(const std::vector<std::string>& args, std::ostream& out, std::ostream& err, const CliConfig& cfg) {
    auto log = [&](const std::string& msg) { if (cfg.debug) err << "[launch-toml] " << msg << std::endl; };
    const std::string& path = args[1];
    const std::string& mode = args[2];

    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        log("no such file: " + path);
        return 1;
    }

    ProcessMap processes = load_processes(path);
    log("resolved " + std::to_string(processes.size()) + " process type(s) from " + path);

    if (mode == "--yaml") {
        out << format_yaml(processes);
        return 0;
    }
    if (mode == "--process" && args.size() == 4) {
        const std::string* command = processes.find(args[3]);
        if (!command || command->empty()) {
            log("process type not found: " + args[3]);
            return 1;
        }
        out << *command << "\n";
        return 0;
    }
    err << usage_text(cfg) << std::endl;
    return 1;
}

int run_cli(const std::vector<std::string>& args, std::ostream& out, std::ostream& err, const CliConfig& cfg) {
    if (args.size() != 3 && args.size() != 4) {
        err << usage_text(cfg) << std::endl;
        return 1;
    }
    try {
        return run_mode(args, out, err, cfg);
    } catch (const std::exception& e) {
        if (cfg.debug) err << "[launch-toml] error: " << e.what() << std::endl;
        return 1;
    }
}

} // namespace launchtoml
