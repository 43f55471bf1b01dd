/*
 * Launch-TOML Literal Scanner Implementation
 * Copyright (c) 2025 iDev srl
 * Description: See header for overview.
 */
#include <launch-toml/lex/literal_scanner.hpp>

namespace launchtoml {

LiteralScanner::LiteralScanner(std::string_view input) : m_input(input) {}

char LiteralScanner::peek() const { return eof() ? '\0' : m_input[m_pos]; }
char LiteralScanner::get() { return eof() ? '\0' : m_input[m_pos++]; }
bool LiteralScanner::eof() const { return m_pos >= m_input.size(); }

bool LiteralScanner::is_quote(char c) { return c == '"' || c == '\''; }

bool LiteralScanner::next(Literal& out) {
    while (!eof() && !is_quote(peek())) get();
    if (eof()) return false;
    std::size_t start = m_pos; char open = get();
    std::size_t close = m_pos;
    while (close < m_input.size() && !is_quote(m_input[close])) ++close;
    // unterminated: nothing after this quote can close a literal either
    if (close >= m_input.size()) { m_pos = m_input.size(); return false; }
    out = Literal{std::string(m_input.substr(m_pos, close - m_pos)), open, start};
    m_pos = close + 1;
    return true;
}

LiteralList LiteralScanner::run() {
    LiteralList lits; Literal lit;
    while (next(lit)) lits.push_back(lit);
    return lits;
}

std::vector<std::string> scan_literals(std::string_view input) {
    std::vector<std::string> out;
    for (auto &lit : LiteralScanner(input).run()) out.push_back(lit.text);
    return out;
}

} // namespace launchtoml
