/*
 * Launch-TOML command line front end
 *
 * Copyright (c) 2025 iDev srl
 *
 * Description:
 *   launch-toml <launch.toml> --yaml
 *   launch-toml <launch.toml> --process <type>
 *
 *   run_cli validates arguments, loads the descriptor and writes the requested
 *   output. It returns the process exit status (0 on success, 1 on usage
 *   errors, a missing input path or an unknown process type). Streams are
 *   injected so the whole flow can be driven from tests.
 *
 * License (MIT):
 *   Permission is hereby granted, free of charge, to any person obtaining a copy of this
 *   software and associated documentation files (the "Software"), to deal in the Software
 *   without restriction, including without limitation the rights to use, copy, modify, merge,
 *   publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons
 *   to whom the Software is furnished to do so, subject to the following conditions:
 *
 *   The above copyright notice and this permission notice shall be included in all copies or
 *   substantial portions of the Software.
 *
 *   THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED,
 *   INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR
 *   PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE
 *   FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR
 *   OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER
 *   DEALINGS IN THE SOFTWARE.
 */
#pragma once
#include <iosfwd>
#include <string>
#include <vector>

namespace launchtoml {

struct CliConfig {
    bool debug = false;                  // LAUNCH_TOML_DEBUG: diagnostics on the error stream
    std::string prog_name = "launch-toml"; // LAUNCH_TOML_PROG: name shown in the usage line
};

// Reads LAUNCH_TOML_DEBUG / LAUNCH_TOML_PROG from the environment.
CliConfig load_cli_config();

std::string usage_text(const CliConfig& cfg);

// args includes the program name at index 0, like argv.
int run_cli(const std::vector<std::string>& args, std::ostream& out, std::ostream& err,
            const CliConfig& cfg = {});

} // namespace launchtoml
