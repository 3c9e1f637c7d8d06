#pragma once

#include <string>
#include <vector>
#include <core/types.hpp>

// Generate sbatch resource arguments from a resolved profile.
// Produces: partition, nodes, cpus-per-task, mem, and when set gres, time,
// exclude, account, followed by the profile's extra args.
// Only emits --gres if gpu_count > 0 and gpu_type is non-empty.
std::vector<std::string> sbatch_resource_args(const SlurmProfile& profile);

// Format GPU gres string: "gpu:a100:4" or "" if no GPUs requested.
std::string format_gpu_gres(const std::string& gpu_type, int gpu_count);

// Parse GPU shorthand into type and count.
// Accepts: "a100", "a100:2", "2" (count only), "none"/"false" (no GPU).
void parse_gpu_shorthand(const std::string& value, std::string& out_type, int& out_count);

// Parse a memory string like "128G", "4096M", "4G" to megabytes.
// Returns 0 on parse failure.
int parse_memory_mb(const std::string& mem_str);
