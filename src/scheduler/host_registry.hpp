#pragma once

#include <string>
#include <vector>
#include <map>
#include <filesystem>
#include <core/types.hpp>

namespace fs = std::filesystem;

struct HostEntry {
    std::string name;
    std::string host;
    std::string user;
    int port = 22;
    std::string ssh_key_path;
};

// Bare-metal machines reachable over SSH. Loaded once at process start and
// written back to disk on every change.
class HostRegistry {
public:
    explicit HostRegistry(const fs::path& path);

    Result<void> load();

    // add() replaces an existing entry with the same name.
    Result<void> add(const HostEntry& entry);
    Result<void> remove(const std::string& name);

    const HostEntry* find(const std::string& name) const;
    const std::map<std::string, HostEntry>& hosts() const { return hosts_; }

    const fs::path& path() const { return path_; }

private:
    fs::path path_;
    std::map<std::string, HostEntry> hosts_;

    Result<void> flush() const;
};
