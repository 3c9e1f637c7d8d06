#pragma once

#include <string>
#include "job_node.hpp"

namespace YAML { class Node; }

class Pipeline;

// Tagged-union records: {"type": "job"|"sequential"|"parallel"|"passthrough"|"pipeline", ...}.
// Decoding throws UnknownVariantError on an unrecognized tag and
// MalformedRecordError when a required field is missing or mistyped.
YAML::Node to_snapshot(const JobNode& node);
YAML::Node to_snapshot(const Pipeline& pipeline);

JobNode node_from_snapshot(const YAML::Node& record);
Pipeline pipeline_from_snapshot(const YAML::Node& record);

// JSON text. Decoding accepts any YAML-compatible document, JSON included.
std::string to_json(const JobNode& node);
std::string to_json(const Pipeline& pipeline);
JobNode node_from_json(const std::string& text);
Pipeline pipeline_from_json(const std::string& text);

// Parse text into a record, raising MalformedRecordError on a syntax error.
YAML::Node parse_record(const std::string& text);

// Emit a record as single-line JSON.
std::string emit_json(const YAML::Node& record);
