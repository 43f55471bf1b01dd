/*
 * Launch-TOML Block Extractor
 *
 * Copyright (c) 2025 iDev srl
 *
 * Description:
 *   Splits a launch descriptor into the raw text segments that follow each
 *   `[[processes]]` table-array marker. Matching is a plain byte search with
 *   no line anchoring: the marker is recognised wherever it occurs, and text
 *   before the first occurrence is dropped. Segments are views into the
 *   input, so the input must outlive them.
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
#include <string_view>
#include <vector>
#include <cstddef>

namespace launchtoml {

inline constexpr std::string_view kProcessesMarker = "[[processes]]";

// Lazy splitter: each call to next() yields the segment after the next marker.
class BlockSplitter {
public:
    explicit BlockSplitter(std::string_view input);
    std::optional<std::string_view> next();
private:
    std::string_view m_input;
    std::size_t m_pos = std::string_view::npos; // start of the pending segment, npos when done
};

std::vector<std::string_view> split_process_blocks(std::string_view input);

} // namespace launchtoml
