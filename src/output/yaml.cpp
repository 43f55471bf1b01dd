/*
 * Launch-TOML YAML output
 * Copyright (c) 2025 iDev srl
 * MIT License.
 */
#include <launch-toml/output/yaml.hpp>
#include <sstream>

namespace launchtoml {

std::string format_yaml(const ProcessMap& map) {
    if (map.empty()) return {};
    std::ostringstream oss;
    oss << "---\ndefault_process_types:\n";
    for (auto &e : map) oss << "  " << e.type << ": " << e.command << "\n";
    return oss.str();
}

} // namespace launchtoml
