/*
 * Launch-TOML YAML output
 * Copyright (c) 2025 iDev srl
 * MIT License.
 */
#pragma once
#include <launch-toml/model/process_map.hpp>
#include <string>

namespace launchtoml {

// `---\ndefault_process_types:\n  <type>: <command>\n...` for bin/release.
// Values are written verbatim. An empty map yields an empty string.
std::string format_yaml(const ProcessMap& map);

} // namespace launchtoml
