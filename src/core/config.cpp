#include "config.hpp"
#include "constants.hpp"
#include "resource_spec.hpp"
#include "utils.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <fstream>
#include <cstdlib>

namespace fs = std::filesystem;

// ── Profiles ──────────────────────────────────────────────────

static Result<SlurmProfile> parse_profile(const std::string& name, const YAML::Node& node) {
    SlurmProfile p;
    if (!node.IsMap()) {
        return Result<SlurmProfile>::Err(fmt::format("Profile '{}' must be a mapping", name));
    }

    p.partition = node["partition"].as<std::string>("");
    p.time = node["time"].as<std::string>("");
    p.nodes = node["nodes"].as<int>(1);
    p.cpus_per_task = node["cpus_per_task"].as<int>(1);
    if (node["cpus"] && node["cpus"].IsScalar()) {
        p.cpus_per_task = node["cpus"].as<int>(1);
    }
    p.memory = node["memory"].as<std::string>(DEFAULT_MEMORY);
    p.gpu_type = node["gpu_type"].as<std::string>("");
    p.gpu_count = node["gpu_count"].as<int>(0);
    if (node["gpu"] && node["gpu"].IsScalar()) {
        parse_gpu_shorthand(node["gpu"].as<std::string>(), p.gpu_type, p.gpu_count);
    }
    p.exclude_nodes = node["exclude_nodes"].as<std::string>("");
    p.account = node["account"].as<std::string>("");

    if (node["extra"]) {
        if (node["extra"].IsSequence()) {
            p.extra_args = node["extra"].as<std::vector<std::string>>(std::vector<std::string>());
        } else if (node["extra"].IsScalar()) {
            p.extra_args.push_back(node["extra"].as<std::string>());
        }
    }

    if (parse_memory_mb(p.memory) <= 0) {
        return Result<SlurmProfile>::Err(
            fmt::format("Profile '{}' has an invalid memory value: '{}'", name, p.memory));
    }
    if (p.nodes <= 0 || p.cpus_per_task <= 0) {
        return Result<SlurmProfile>::Err(
            fmt::format("Profile '{}' must request at least one node and one cpu", name));
    }

    return Result<SlurmProfile>::Ok(p);
}

static void apply_login(const YAML::Node& node, LoginConfig& login) {
    if (node["host"]) login.host = node["host"].as<std::string>("");
    if (node["user"]) login.user = node["user"].as<std::string>("");
    if (node["password"]) login.password = node["password"].as<std::string>("");
    if (node["port"]) login.port = node["port"].as<int>(SSH_DEFAULT_PORT);
    if (node["timeout"]) login.timeout = node["timeout"].as<int>(30);
    if (node["ssh_key_path"]) {
        login.ssh_key_path = expand_home(node["ssh_key_path"].as<std::string>());
    }
}

// ── Config ────────────────────────────────────────────────────

Config::Config() {
    runner_.state_dir = get_global_config_dir().string();
}

Result<void> Config::apply(const YAML::Node& node) {
    if (!node || node.IsNull()) return Result<void>::Ok();
    if (!node.IsMap()) {
        return Result<void>::Err("Configuration root must be a mapping");
    }

    try {
        if (node["scheduler"]) {
            runner_.scheduler = node["scheduler"].as<std::string>("slurm");
            if (runner_.scheduler != "slurm" && runner_.scheduler != "baremetal") {
                return Result<void>::Err("Unknown scheduler: " + runner_.scheduler);
            }
        }
        if (node["host"]) runner_.host = node["host"].as<std::string>("");
        if (node["templates"]) runner_.templates = node["templates"].as<std::string>(DEFAULT_TEMPLATES_DIR);
        if (node["state_dir"]) runner_.state_dir = expand_home(node["state_dir"].as<std::string>(""));

        if (node["workdir"] && node["workdir"].IsMap()) {
            const auto& wd = node["workdir"];
            if (wd["local"]) runner_.workdir.local = wd["local"].as<std::string>(DEFAULT_LOCAL_WORKDIR);
            if (wd["remote"]) runner_.workdir.remote = wd["remote"].as<std::string>(DEFAULT_REMOTE_WORKDIR);
        }

        if (node["login"] && node["login"].IsMap()) {
            apply_login(node["login"], login_);
        }

        if (node["profiles"] && node["profiles"].IsMap()) {
            for (const auto& kv : node["profiles"]) {
                std::string name = kv.first.as<std::string>();
                auto profile = parse_profile(name, kv.second);
                if (profile.is_err()) return Result<void>::Err(profile.error);
                runner_.profiles[name] = profile.value;
            }
        }
    } catch (const YAML::Exception& e) {
        return Result<void>::Err("Invalid configuration value: " + std::string(e.what()));
    }

    return Result<void>::Ok();
}

Result<void> Config::apply_file(Config& config, const fs::path& path) {
    if (!fs::exists(path)) return Result<void>::Ok();

    YAML::Node root;
    try {
        root = YAML::LoadFile(path.string());
    } catch (const YAML::Exception& e) {
        return Result<void>::Err(fmt::format("Failed to parse {}: {}", path.string(), e.what()));
    }
    auto r = config.apply(root);
    if (r.is_err()) {
        return Result<void>::Err(fmt::format("{}: {}", path.string(), r.error));
    }
    return r;
}

Result<Config> Config::load(const fs::path& project_dir) {
    Config config;
    config.project_dir_ = project_dir;

    auto g = apply_file(config, get_global_config_path());
    if (g.is_err()) return Result<Config>::Err(g.error);

    auto p = apply_file(config, get_project_config_path(project_dir));
    if (p.is_err()) return Result<Config>::Err(p.error);

    return Result<Config>::Ok(config);
}

Result<Config> Config::from_yaml(const std::string& text) {
    Config config;
    config.project_dir_ = fs::current_path();

    YAML::Node root;
    try {
        root = YAML::Load(text);
    } catch (const YAML::Exception& e) {
        return Result<Config>::Err("Failed to parse configuration: " + std::string(e.what()));
    }
    auto r = config.apply(root);
    if (r.is_err()) return Result<Config>::Err(r.error);
    return Result<Config>::Ok(config);
}

fs::path Config::state_dir() const {
    return fs::path(runner_.state_dir);
}

fs::path Config::templates_dir() const {
    fs::path t(runner_.templates);
    return t.is_absolute() ? t : project_dir_ / t;
}

fs::path Config::local_workdir() const {
    fs::path w(runner_.workdir.local);
    return w.is_absolute() ? w : project_dir_ / w;
}

const SlurmProfile* Config::find_profile(const std::string& name) const {
    auto it = runner_.profiles.find(name);
    return it == runner_.profiles.end() ? nullptr : &it->second;
}

// ── Paths ─────────────────────────────────────────────────────

bool global_config_exists() {
    return fs::exists(get_global_config_path());
}

fs::path get_global_config_dir() {
    return platform::home_dir() / ".jobrunner";
}

fs::path get_global_config_path() {
    return get_global_config_dir() / "config.yaml";
}

fs::path get_project_config_path(const fs::path& dir) {
    return dir / "jobrunner.yaml";
}

Result<void> create_default_global_config() {
    fs::path config_path = get_global_config_path();

    // Don't overwrite existing config
    if (fs::exists(config_path)) {
        return Result<void>::Ok();
    }

    fs::create_directories(config_path.parent_path());

    const char* default_config = R"(# Job runner configuration
# Project settings in ./jobrunner.yaml override the keys below.

scheduler: slurm                   # slurm | baremetal

# Cluster login node. Leave host empty to run sbatch/sacct locally.
login:
  host: ""
  user: ""
  ssh_key_path: "~/.ssh/id_ed25519"
  timeout: 30

workdir:
  local: "data"                    # job folders are created here before submission
  remote: "scratch/jobrunner"      # --chdir/--output root on the cluster

templates: "scripts/slurm"         # <templates>/<script>.sh

# Resource profiles referenced by jobs
profiles:
  pin:
    partition: "batch"
    time: "0:30:00"
  install:
    partition: "batch"
    time: "1:00:00"
  prepare:
    partition: "batch"
    time: "2:00:00"
  A100:
    gpu: "a100:4"
    memory: "64G"
    cpus: 16
    time: "4:00:00"
)";

    try {
        std::ofstream out(config_path);
        if (!out) {
            return Result<void>::Err("Failed to create config file at " + config_path.string());
        }
        out << default_config;
        out.close();
        return Result<void>::Ok();
    } catch (const std::exception& e) {
        return Result<void>::Err("Failed to write config file: " + std::string(e.what()));
    }
}
