#pragma once

#include <string>
#include <optional>
#include <vector>
#include <map>
#include <functional>
#include <cstdint>

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;

    static Result<T> Ok(T val) {
        return {true, std::move(val), ""};
    }

    static Result<T> Err(const std::string& err) {
        return {false, T{}, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;

    static Result<void> Ok() {
        return {true, ""};
    }

    static Result<void> Err(const std::string& err) {
        return {false, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Shell command execution result (local or over SSH)
struct CommandResult {
    int exit_code;
    std::string stdout_data;
    std::string stderr_data;

    bool success() const { return exit_code == 0; }
    bool failed() const { return exit_code != 0; }

    std::string get_output() const {
        return stdout_data.empty() ? stderr_data : stdout_data;
    }
};

// Configuration structures
struct LoginConfig {
    std::string host;                            // empty = run scheduler commands locally
    std::string user;
    std::string password;
    int port = 22;
    int timeout = 30;
    std::optional<std::string> ssh_key_path;
};

struct WorkdirConfig {
    std::string local = "data";                  // job folders are materialized here
    std::string remote = "scratch/jobrunner";    // --chdir/--output root on the cluster
};

// Named resource/environment profile (e.g. a hardware class)
struct SlurmProfile {
    std::string partition;
    std::string time;
    int nodes = 1;
    int cpus_per_task = 1;
    std::string memory = "4G";
    std::string gpu_type;
    int gpu_count = 0;
    std::string exclude_nodes;    // nodes to exclude (e.g. "s1cmp003,s1cmp004")
    std::string account;
    std::vector<std::string> extra_args;         // passed verbatim to sbatch
};

struct JobRunnerConfig {
    std::string scheduler = "slurm";             // "slurm" or "baremetal"
    std::string host;                            // bare-metal host name (registry key)
    std::string templates = "scripts/slurm";     // directory holding job scripts
    std::string state_dir;                       // snapshots + host registry
    WorkdirConfig workdir;
    std::map<std::string, SlurmProfile> profiles;
};

// Status callback for operations
using StatusCallback = std::function<void(const std::string&)>;
