/*
 * Launch-TOML Command Reconstructor Implementation
 * Copyright (c) 2025 iDev srl
 * Description: See header for details.
 */
#include <launch-toml/parse/process_entry.hpp>
#include <launch-toml/lex/literal_scanner.hpp>
#include <launch-toml/quote/shell_quote.hpp>
#include <cctype>

namespace launchtoml {

// isspace plus the \x1c-\x1f separators. Non-ASCII spaces (U+00A0, U+2028...)
// are multi-byte in UTF-8 and never count as whitespace here.
static bool is_space(char c) {
    unsigned char u = static_cast<unsigned char>(c);
    return std::isspace(u) != 0 || (u >= 0x1c && u <= 0x1f);
}
static bool is_quote(char c) { return c == '"' || c == '\''; }

// Position just past `key\s*=\s*` for the occurrence of key at `at`, or npos.
static std::size_t after_assignment(std::string_view s, std::size_t at, std::string_view key) {
    std::size_t i = at + key.size();
    while (i < s.size() && is_space(s[i])) ++i;
    if (i >= s.size() || s[i] != '=') return std::string_view::npos;
    ++i;
    while (i < s.size() && is_space(s[i])) ++i;
    return i;
}

std::optional<std::string> find_type_field(std::string_view block) {
    static constexpr std::string_view key = "type";
    for (std::size_t at = block.find(key); at != std::string_view::npos; at = block.find(key, at + 1)) {
        std::size_t i = after_assignment(block, at, key);
        if (i == std::string_view::npos || i >= block.size() || !is_quote(block[i])) continue;
        std::size_t start = ++i;
        while (i < block.size() && !is_quote(block[i])) ++i;
        if (i >= block.size() || i == start) continue; // unterminated or empty value
        return std::string(block.substr(start, i - start));
    }
    return std::nullopt;
}

std::optional<std::string_view> find_command_array(std::string_view block) {
    static constexpr std::string_view key = "command";
    for (std::size_t at = block.find(key); at != std::string_view::npos; at = block.find(key, at + 1)) {
        std::size_t i = after_assignment(block, at, key);
        if (i == std::string_view::npos || i >= block.size() || block[i] != '[') continue;
        std::size_t close = block.find(']', i + 1);
        // no later occurrence can find a closing bracket either
        if (close == std::string_view::npos) return std::nullopt;
        return block.substr(i + 1, close - i - 1);
    }
    return std::nullopt;
}

std::string reconstruct_command(const std::vector<std::string>& tokens) {
    if (tokens.size() >= 3 && tokens[0] == "bash" && tokens[1] == "-c") return tokens[2];
    return shell_join(tokens);
}

std::optional<ProcessEntry> parse_process_block(std::string_view block) {
    auto type = find_type_field(block);
    if (!type) return std::nullopt;
    auto array = find_command_array(block);
    if (!array) return std::nullopt;
    auto tokens = scan_literals(*array);
    if (tokens.empty()) return std::nullopt;
    return ProcessEntry{*type, reconstruct_command(tokens)};
}

} // namespace launchtoml
