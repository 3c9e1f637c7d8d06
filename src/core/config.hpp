#pragma once

#include <string>
#include <optional>
#include <filesystem>
#include "types.hpp"

namespace fs = std::filesystem;

namespace YAML { class Node; }

class Config {
public:
    // Load ~/.jobrunner/config.yaml, then ./jobrunner.yaml on top
    // (project keys override global ones)
    static Result<Config> load(const fs::path& project_dir = fs::current_path());

    // Parse a single YAML document (used by the loaders and by tests)
    static Result<Config> from_yaml(const std::string& text);

    // Accessors
    const LoginConfig& login() const { return login_; }
    const JobRunnerConfig& runner() const { return runner_; }
    const fs::path& project_dir() const { return project_dir_; }

    // Resolved locations
    fs::path state_dir() const;
    fs::path templates_dir() const;
    fs::path local_workdir() const;

    const SlurmProfile* find_profile(const std::string& name) const;

public:
    Config();

private:
    LoginConfig login_;
    JobRunnerConfig runner_;
    fs::path project_dir_;

    // Overlay every key present in `node` on top of the current values.
    Result<void> apply(const YAML::Node& node);
    static Result<void> apply_file(Config& config, const fs::path& path);
};

bool global_config_exists();

// Get paths
fs::path get_global_config_dir();
fs::path get_global_config_path();
fs::path get_project_config_path(const fs::path& dir = fs::current_path());

// Create default global config
Result<void> create_default_global_config();
