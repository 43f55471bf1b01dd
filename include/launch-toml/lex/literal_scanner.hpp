/*
 * Launch-TOML Literal Scanner
 *
 * Copyright (c) 2025 iDev srl
 *
 * Description:
 *   Extracts quoted string literals ('...' or "...") from a span of text, in
 *   document order. Anything outside quotes (commas, whitespace, comments) is
 *   skipped. A literal opens at any quote character and closes at the next
 *   quote character of either kind; no escape sequences are recognised. Used
 *   on the bracketed body of a `command = [ ... ]` array.
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
#include <string>
#include <string_view>
#include <vector>
#include <cstddef>

namespace launchtoml {

struct Literal {
    std::string text;
    char quote;       // opening quote character
    std::size_t pos;  // offset of the opening quote
};

using LiteralList = std::vector<Literal>;

class LiteralScanner {
public:
    explicit LiteralScanner(std::string_view input);
    LiteralList run();
private:
    bool next(Literal& out);
    char peek() const;
    char get();
    bool eof() const;
    static bool is_quote(char c);

    std::string_view m_input;
    std::size_t m_pos = 0; // current index
};

// Convenience: texts of every literal in `input`, in order.
std::vector<std::string> scan_literals(std::string_view input);

} // namespace launchtoml
