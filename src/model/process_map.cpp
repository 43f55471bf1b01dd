/*
 * Launch-TOML Process Map Implementation
 * Copyright (c) 2025 iDev srl
 * MIT License.
 */
#include <launch-toml/model/process_map.hpp>
#include <launch-toml/parse/blocks.hpp>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <system_error>

namespace launchtoml {

void ProcessMap::set(std::string type, std::string command) {
    for (auto &e : m_entries) {
        if (e.type == type) { e.command = std::move(command); return; }
    }
    m_entries.push_back(ProcessEntry{std::move(type), std::move(command)});
}

const std::string* ProcessMap::find(std::string_view type) const {
    for (auto &e : m_entries) if (e.type == type) return &e.command;
    return nullptr;
}

ProcessMap parse_processes(std::string_view content) {
    ProcessMap map;
    BlockSplitter splitter(content);
    while (auto block = splitter.next()) {
        auto entry = parse_process_block(*block);
        if (!entry) continue;
        map.set(std::move(entry->type), std::move(entry->command));
    }
    return map;
}

std::string normalize_newlines(std::string_view text) {
    std::string out; out.reserve(text.size());
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (text[i] != '\r') { out.push_back(text[i]); continue; }
        out.push_back('\n');
        if (i + 1 < text.size() && text[i + 1] == '\n') ++i;
    }
    return out;
}

std::optional<std::string> read_file(const std::string& path) {
    std::error_code ec;
    // a directory opens fine as a filebuf on Linux but every read fails
    if (std::filesystem::is_directory(path, ec)) return std::nullopt;
    std::ifstream in(path, std::ios::in | std::ios::binary);
    if (!in) return std::nullopt;
    std::string data{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
    if (in.bad()) return std::nullopt;
    return normalize_newlines(data);
}

ProcessMap load_processes(const std::string& path) {
    auto content = read_file(path);
    if (!content) return {};
    return parse_processes(*content);
}

} // namespace launchtoml
