#pragma once

#include <string>
#include <vector>
#include <map>
#include <cstdint>
#include <core/types.hpp>
#include <core/constants.hpp>

// Job lifecycle. Idle is never persisted: it only describes an executor with
// no job loaded.
enum class JobStatus : std::uint8_t { Idle, Processing, Paused, Completed, Crashed };

const char* job_status_name(JobStatus status);
bool parse_job_status(const std::string& name, JobStatus& out);

// Paused or crashed: resume() is allowed.
bool is_resumable_status(JobStatus status);

struct ChunkResult {
    int chunk_index = -1;
    std::int64_t input_chars = 0;
    std::int64_t output_chars = 0;
    std::int64_t input_tokens = 0;
    std::int64_t output_tokens = 0;
    double cost = 0.0;
    std::string model;              // which configuration produced it
    std::string provider;
    std::string output;             // processed payload
};

// Durable state of one chunked processing session.
struct JobRecord {
    int schema_version = RECORD_SCHEMA_VERSION;
    std::string job_id;
    std::string name;
    JobStatus status = JobStatus::Idle;
    std::string created_at;         // ISO timestamp (UTC)
    std::string last_updated;       // ISO timestamp (UTC), never decreases
    JobConfig config;               // fixed at creation

    int total_chunks = 0;
    std::vector<int> completed_chunks;          // sorted, unique
    std::map<int, std::string> failed_chunks;   // index -> last error
    std::vector<ChunkResult> results;           // sorted by chunk_index

    double estimated_cost = 0.0;
    double actual_cost = 0.0;
    std::int64_t total_input_tokens = 0;
    std::int64_t total_output_tokens = 0;

    std::string last_error;         // fatal error that crashed the job

    bool is_completed(int chunk_index) const;

    // Indices not yet completed, ascending. Failed chunks are included:
    // a failure is retried on resume, never skipped.
    std::vector<int> pending_chunks() const;

    double progress_pct() const;
};

// Reduced projection for presentation (no result payloads).
struct JobSummary {
    std::string job_id;
    std::string name;
    JobStatus status = JobStatus::Idle;
    int completed = 0;
    int total = 0;
    int failed = 0;
    double progress_pct = 0.0;
    double estimated_cost = 0.0;
    double actual_cost = 0.0;
    std::int64_t total_input_tokens = 0;
    std::int64_t total_output_tokens = 0;
    std::string created_at;
    std::string last_updated;
};

JobSummary summarize_record(const JobRecord& record);

// ── Checkpoint-time constructors ───────────────────────────
// Each returns a new record; the input is never modified.

// Chunk succeeded: record result, mark completed, drop any earlier failure,
// fold cost/token totals (replacing the totals of an earlier result for the
// same index).
JobRecord with_chunk_result(const JobRecord& record, const ChunkResult& result);

// Chunk failed recoverably. The index stays pending.
JobRecord with_chunk_failure(const JobRecord& record, int chunk_index, const std::string& error);

JobRecord with_status(const JobRecord& record, JobStatus status);

// Fatal error: status crashed, error kept in last_error. When the error
// belongs to a chunk, any earlier failure entry for it is dropped: a crashed
// chunk is in neither the completed nor the failed set.
JobRecord with_crash(const JobRecord& record, const std::string& error, int chunk_index = -1);

// Structural validation applied before every write and after every read.
Result<void> validate_record(const JobRecord& record);
