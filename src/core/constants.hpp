#pragma once

// ── Record schema ───────────────────────────────────────────
constexpr int RECORD_SCHEMA_VERSION = 1;

// ── Locking ─────────────────────────────────────────────────
constexpr int LOCK_TIMEOUT_MS      = 10000;  // Max wait for exclusive access to a job
constexpr int LOCK_POLL_MS         = 50;     // Delay between lock attempts

// ── State directory layout ──────────────────────────────────
// Use fmt::format with these: fmt::format(PRIMARY_FILE_FMT, job_id)
constexpr const char* PRIMARY_FILE_FMT  = "{}.yaml";
constexpr const char* BACKUP_FILE_FMT   = "{}.backup.yaml";
constexpr const char* STAGING_FILE_FMT  = ".{}.yaml.tmp";
constexpr const char* LOCK_FILE_FMT     = "{}.lock";
constexpr const char* RUN_LOCK_FILE_FMT = "{}.run.lock";
constexpr const char* JOB_LOGS_DIR      = "logs";

// ── Processor defaults (recorded into new job configs) ──────
constexpr const char* DEFAULT_MODEL           = "claude-3-5-sonnet-20241022";
constexpr const char* DEFAULT_PROVIDER        = "anthropic";
constexpr double      DEFAULT_TEMPERATURE     = 0.3;
constexpr int         DEFAULT_MAX_TOKENS      = 4096;
constexpr const char* DEFAULT_OUTPUT_LANGUAGE = "English";
constexpr int         DEFAULT_CHUNK_SIZE      = 2000;  // characters per chunk
constexpr int         DEFAULT_CHUNK_OVERLAP   = 200;   // characters of preceding context

constexpr const char* CHUNKPOINT_VERSION = "0.1.0";
