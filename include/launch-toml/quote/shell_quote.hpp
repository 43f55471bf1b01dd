/*
 * Launch-TOML Shell Quoting
 * Copyright (c) 2025 iDev srl
 * MIT License.
 *
 * Description:
 *   POSIX shell quoting helpers. shell_join turns a word list into one
 *   command line that a POSIX shell splits back into the same words;
 *   shell_split performs that word splitting (quotes and backslash escapes,
 *   no expansion).
 */
#pragma once
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace launchtoml {

// Quote a single word for /bin/sh. Words made only of [A-Za-z0-9_@%+=:,./-]
// are returned unchanged, the empty word becomes ''.
std::string shell_quote(std::string_view word);

// shell_quote every word and join with a single space.
std::string shell_join(const std::vector<std::string>& words);

// Split a command line into words. Returns nullopt on an unterminated quote
// or a trailing backslash.
std::optional<std::vector<std::string>> shell_split(std::string_view line);

} // namespace launchtoml
