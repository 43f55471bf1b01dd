/*
 * Launch-TOML Block Extractor Implementation
 * Copyright (c) 2025 iDev srl
 * Description: See header for details.
 */
#include <launch-toml/parse/blocks.hpp>

namespace launchtoml {

BlockSplitter::BlockSplitter(std::string_view input) : m_input(input) {
    std::size_t first = m_input.find(kProcessesMarker);
    if (first != std::string_view::npos) m_pos = first + kProcessesMarker.size();
}

std::optional<std::string_view> BlockSplitter::next() {
    if (m_pos == std::string_view::npos) return std::nullopt;
    std::size_t start = m_pos;
    std::size_t marker = m_input.find(kProcessesMarker, start);
    if (marker == std::string_view::npos) {
        m_pos = std::string_view::npos;
        return m_input.substr(start);
    }
    m_pos = marker + kProcessesMarker.size();
    return m_input.substr(start, marker - start);
}

std::vector<std::string_view> split_process_blocks(std::string_view input) {
    std::vector<std::string_view> blocks;
    BlockSplitter splitter(input);
    while (auto block = splitter.next()) blocks.push_back(*block);
    return blocks;
}

} // namespace launchtoml
