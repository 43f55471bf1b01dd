/*
 * Launch-TOML Shell Quoting Implementation
 * Copyright (c) 2025 iDev srl
 * MIT License.
 */
#include <launch-toml/quote/shell_quote.hpp>
#include <cctype>

namespace launchtoml {

static bool is_safe_char(char c) {
    unsigned char u = static_cast<unsigned char>(c);
    if (u >= 0x80) return false; // ASCII only
    if (std::isalnum(u)) return true;
    switch (c) {
        case '_': case '@': case '%': case '+': case '=':
        case ':': case ',': case '.': case '/': case '-':
            return true;
        default: return false;
    }
}

std::string shell_quote(std::string_view word) {
    if (word.empty()) return "''";
    bool safe = true;
    for (char c : word) if (!is_safe_char(c)) { safe = false; break; }
    if (safe) return std::string(word);
    std::string out; out.reserve(word.size() + 2);
    out.push_back('\'');
    for (char c : word) {
        if (c == '\'') out += "'\"'\"'";
        else out.push_back(c);
    }
    out.push_back('\'');
    return out;
}

std::string shell_join(const std::vector<std::string>& words) {
    std::string out;
    for (std::size_t i = 0; i < words.size(); ++i) {
        if (i) out.push_back(' ');
        out += shell_quote(words[i]);
    }
    return out;
}

std::optional<std::vector<std::string>> shell_split(std::string_view line) {
    std::vector<std::string> words;
    std::string cur; bool in_word = false, in_single = false, in_double = false;
    std::size_t i = 0;
    while (i < line.size()) {
        char c = line[i++];
        if (in_single) {
            if (c == '\'') { in_single = false; continue; }
            cur.push_back(c);
        } else if (in_double) {
            if (c == '"') { in_double = false; continue; }
            if (c == '\\' && i < line.size()) {
                char n = line[i];
                if (n == '"' || n == '\\' || n == '$' || n == '`') { cur.push_back(n); ++i; continue; }
                if (n == '\n') { ++i; continue; }
            }
            cur.push_back(c);
        } else {
            if (std::isspace(static_cast<unsigned char>(c))) {
                if (in_word) { words.push_back(cur); cur.clear(); in_word = false; }
                continue;
            }
            in_word = true;
            if (c == '\'') { in_single = true; continue; }
            if (c == '"') { in_double = true; continue; }
            if (c == '\\') {
                if (i >= line.size()) return std::nullopt;
                cur.push_back(line[i++]);
                continue;
            }
            cur.push_back(c);
        }
    }
    if (in_single || in_double) return std::nullopt;
    if (in_word) words.push_back(cur);
    return words;
}

} // namespace launchtoml
