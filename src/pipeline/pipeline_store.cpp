#include "pipeline_store.hpp"
#include "codec.hpp"
#include <core/errors.hpp>
#include <core/log.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <algorithm>
#include <fstream>
#include <sstream>

static const char* SNAPSHOT_EXT = ".json";

static std::string read_file(const fs::path& path) {
    std::ifstream in(path);
    if (!in) {
        throw MalformedRecordError("Cannot read " + path.string());
    }
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

PipelineStore::PipelineStore(const fs::path& state_dir)
    : dir_(state_dir / "pipelines") {
}

fs::path PipelineStore::path_for(const std::string& name) const {
    return dir_ / (name + SNAPSHOT_EXT);
}

Result<void> PipelineStore::save(const Pipeline& pipeline) {
    std::error_code ec;
    fs::create_directories(dir_, ec);
    if (ec) {
        return Result<void>::Err(fmt::format("Cannot create {}: {}", dir_.string(), ec.message()));
    }

    // Write to a temp file and rename so a crash never leaves half a snapshot.
    fs::path target = path_for(pipeline.name());
    fs::path tmp = target;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out) {
            return Result<void>::Err("Cannot write " + tmp.string());
        }
        out << to_json(pipeline) << "\n";
        if (!out) {
            return Result<void>::Err("Failed writing " + tmp.string());
        }
    }
    fs::rename(tmp, target, ec);
    if (ec) {
        return Result<void>::Err(fmt::format("Cannot replace {}: {}", target.string(), ec.message()));
    }
    jobrunner_log("saved pipeline snapshot " + target.string());
    return Result<void>::Ok();
}

Pipeline PipelineStore::load(const std::string& name) const {
    fs::path path = path_for(name);
    if (!fs::exists(path)) {
        throw MalformedRecordError(fmt::format("No saved pipeline named '{}'", name));
    }
    return pipeline_from_json(read_file(path));
}

bool PipelineStore::exists(const std::string& name) const {
    return fs::exists(path_for(name));
}

std::vector<std::string> PipelineStore::list() const {
    std::vector<std::string> names;
    std::error_code ec;
    if (!fs::is_directory(dir_, ec)) return names;

    for (const auto& entry : fs::directory_iterator(dir_, ec)) {
        if (entry.is_regular_file() && entry.path().extension() == SNAPSHOT_EXT) {
            names.push_back(entry.path().stem().string());
        }
    }
    std::sort(names.begin(), names.end());
    return names;
}

Result<void> PipelineStore::remove(const std::string& name) {
    std::error_code ec;
    if (!fs::remove(path_for(name), ec)) {
        if (ec) return Result<void>::Err(ec.message());
        return Result<void>::Err(fmt::format("No saved pipeline named '{}'", name));
    }
    return Result<void>::Ok();
}

// ── Definitions ───────────────────────────────────────────────

Pipeline load_definition(const fs::path& path) {
    YAML::Node record = parse_record(read_file(path));
    if (record.IsMap() && record["type"] && record["type"].IsScalar() &&
        record["type"].as<std::string>() == "pipeline") {
        return pipeline_from_snapshot(record);
    }
    return Pipeline(path.stem().string(), node_from_snapshot(record));
}

std::optional<Pipeline> builtin_definition(const std::string& name) {
    if (name != "standard") return std::nullopt;

    std::vector<JobNode> runs;
    for (const char* gpu : {"A100l", "A100", "A6000", "H100", "L40S", "rtx8000", "v100"}) {
        runs.push_back(make_job("run", gpu));
    }

    JobNode definition = make_sequential({
        make_job("pin", "pin"),
        make_job("install", "install"),
        make_job("prepare", "prepare"),
        make_parallel(std::move(runs), "gpus"),
    }, "standard");
    return Pipeline("standard", std::move(definition));
}
