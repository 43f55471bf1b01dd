/*
 * Launch-TOML Command Reconstructor
 *
 * Copyright (c) 2025 iDev srl
 *
 * Description:
 *   Turns one `[[processes]]` segment into a ProcessEntry. The first textual
 *   `type = "..."` assignment names the process; the first `command = [...]`
 *   array (which may span lines) supplies the quoted tokens. A `bash -c
 *   <script>` array yields the script verbatim; any other array is re-quoted
 *   into a single POSIX shell command line. Segments missing either field, or
 *   with no quoted tokens in the command array, produce no entry.
 *
 *   Field lookup is purely textual: an assignment inside a comment or a
 *   nested table still matches, and the first match in the segment wins.
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
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace launchtoml {

struct ProcessEntry {
    std::string type;
    std::string command;
};

// Value of the first `type = "<value>"` (or single-quoted) assignment.
std::optional<std::string> find_type_field(std::string_view block);

// Raw text between `command = [` and the first following `]`.
std::optional<std::string_view> find_command_array(std::string_view block);

// `bash -c <script> ...` -> script, anything else -> shell_join(tokens).
// Precondition: tokens is not empty.
std::string reconstruct_command(const std::vector<std::string>& tokens);

std::optional<ProcessEntry> parse_process_block(std::string_view block);

} // namespace launchtoml
