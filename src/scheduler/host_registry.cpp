#include "host_registry.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <fstream>

HostRegistry::HostRegistry(const fs::path& path) : path_(path) {
}

Result<void> HostRegistry::load() {
    hosts_.clear();
    if (!fs::exists(path_)) {
        return Result<void>::Ok();
    }

    try {
        YAML::Node root = YAML::LoadFile(path_.string());
        if (root["hosts"] && root["hosts"].IsMap()) {
            for (const auto& kv : root["hosts"]) {
                HostEntry h;
                h.name = kv.first.as<std::string>();
                h.host = kv.second["host"].as<std::string>("");
                h.user = kv.second["user"].as<std::string>("");
                h.port = kv.second["port"].as<int>(SSH_DEFAULT_PORT);
                h.ssh_key_path = kv.second["ssh_key_path"].as<std::string>("");
                if (h.host.empty()) {
                    return Result<void>::Err(fmt::format("Host '{}' has no address", h.name));
                }
                hosts_[h.name] = h;
            }
        }
    } catch (const YAML::Exception& e) {
        return Result<void>::Err(fmt::format("Failed to load {}: {}", path_.string(), e.what()));
    }

    return Result<void>::Ok();
}

Result<void> HostRegistry::add(const HostEntry& entry) {
    if (entry.name.empty() || entry.host.empty()) {
        return Result<void>::Err("A host needs a name and an address");
    }
    hosts_[entry.name] = entry;
    jobrunner_log(fmt::format("hosts: add {} -> {}@{}", entry.name, entry.user, entry.host));
    return flush();
}

Result<void> HostRegistry::remove(const std::string& name) {
    if (hosts_.erase(name) == 0) {
        return Result<void>::Err("No such host: " + name);
    }
    jobrunner_log("hosts: remove " + name);
    return flush();
}

const HostEntry* HostRegistry::find(const std::string& name) const {
    auto it = hosts_.find(name);
    return it == hosts_.end() ? nullptr : &it->second;
}

Result<void> HostRegistry::flush() const {
    std::error_code ec;
    fs::create_directories(path_.parent_path(), ec);

    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "hosts" << YAML::Value << YAML::BeginMap;
    for (const auto& [name, h] : hosts_) {
        out << YAML::Key << name << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "host" << YAML::Value << h.host;
        out << YAML::Key << "user" << YAML::Value << h.user;
        out << YAML::Key << "port" << YAML::Value << h.port;
        out << YAML::Key << "ssh_key_path" << YAML::Value << h.ssh_key_path;
        out << YAML::EndMap;
    }
    out << YAML::EndMap;
    out << YAML::EndMap;

    std::ofstream fout(path_.string());
    if (!fout) {
        return Result<void>::Err("Cannot write " + path_.string());
    }
    fout << out.c_str() << "\n";
    return Result<void>::Ok();
}
