/*
 * Launch-TOML Process Map
 * Copyright (c) 2025 iDev srl
 * MIT License.
 *
 * Description:
 *   Ordered process-type -> command mapping plus the loaders that build it
 *   from descriptor text or from a file on disk. Keys iterate in first-insert
 *   order; re-inserting a key replaces its value in place.
 */
#pragma once
#include <launch-toml/parse/process_entry.hpp>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace launchtoml {

class ProcessMap {
public:
    using const_iterator = std::vector<ProcessEntry>::const_iterator;

    void set(std::string type, std::string command);
    const std::string* find(std::string_view type) const;
    std::size_t size() const { return m_entries.size(); }
    bool empty() const { return m_entries.empty(); }
    const_iterator begin() const { return m_entries.begin(); }
    const_iterator end() const { return m_entries.end(); }
private:
    std::vector<ProcessEntry> m_entries;
};

ProcessMap parse_processes(std::string_view content);

// \r\n and lone \r become \n.
std::string normalize_newlines(std::string_view text);

// Whole-file read with newlines normalized; nullopt if the path cannot be opened or read.
std::optional<std::string> read_file(const std::string& path);

// Missing or unreadable files give an empty map.
ProcessMap load_processes(const std::string& path);

} // namespace launchtoml
