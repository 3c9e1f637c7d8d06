#pragma once

constexpr const char* JOBRUNNER_VERSION = "0.1.0";

// ── SSH options ─────────────────────────────────────────────
constexpr int SSH_DEFAULT_PORT           = 22;
constexpr int SSH_CMD_TIMEOUT_SECS       = 300;   // Max time for a single SSH command
constexpr int SSH_READ_BUF_SIZE          = 4096;

// ── Dependency expressions ──────────────────────────────────
// Separators inside a --dependency clause. Both are reserved: an external id
// containing either one cannot be expressed as a dependency target.
constexpr const char* DEP_AND_SEP        = ":";   // all listed ids must satisfy the event
constexpr const char* DEP_OR_SEP         = "?";   // any listed id satisfies the event

// ── Status reconciliation ───────────────────────────────────
constexpr int STATUS_QUERY_MAX_RETRIES   = 3;     // Retries for transient query failures
constexpr int STATUS_RETRY_BASE_MS       = 2000;  // First backoff delay, doubled per retry

// ── Default node names ──────────────────────────────────────
constexpr const char* DEFAULT_SEQUENTIAL_NAME = "S";
constexpr const char* DEFAULT_PARALLEL_NAME   = "P";

// ── Default paths ───────────────────────────────────────────
constexpr const char* DEFAULT_LOCAL_WORKDIR  = "data";
constexpr const char* DEFAULT_REMOTE_WORKDIR = "scratch/jobrunner";
constexpr const char* DEFAULT_TEMPLATES_DIR  = "scripts/slurm";
constexpr const char* SCRIPT_EXTENSION       = ".sh";
constexpr const char* JOB_LOG_FILENAME       = "jobrunner.log";
constexpr const char* JOB_OUTPUT_PATTERN     = "slurm-%j.out";

// ── Default resource values ─────────────────────────────────
constexpr const char* DEFAULT_MEMORY     = "4G";
constexpr const char* DEFAULT_PARTITION  = "batch";
constexpr const char* DEFAULT_GPU_PARTITION = "gpu";
