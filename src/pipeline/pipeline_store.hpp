#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include <core/types.hpp>
#include "pipeline.hpp"

namespace fs = std::filesystem;

// Pipeline snapshots on disk: <state_dir>/pipelines/<name>.json.
class PipelineStore {
public:
    explicit PipelineStore(const fs::path& state_dir);

    Result<void> save(const Pipeline& pipeline);

    // Decode errors propagate (UnknownVariantError, MalformedRecordError):
    // a damaged snapshot is never partially loaded.
    Pipeline load(const std::string& name) const;

    bool exists(const std::string& name) const;
    std::vector<std::string> list() const;
    Result<void> remove(const std::string& name);

    fs::path path_for(const std::string& name) const;
    const fs::path& dir() const { return dir_; }

private:
    fs::path dir_;
};

// Read a definition file (JSON or YAML). A pipeline record is used as is;
// a bare node record becomes a pipeline named after the file stem.
Pipeline load_definition(const fs::path& path);

// Built-in definitions by name ("standard"); nullopt if unknown.
std::optional<Pipeline> builtin_definition(const std::string& name);
