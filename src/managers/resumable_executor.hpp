#pragma once

#include <string>
#include <vector>
#include <memory>
#include <optional>
#include <atomic>
#include <functional>
#include <core/types.hpp>
#include <platform/file_lock.hpp>
#include "chunk.hpp"
#include "job_record.hpp"
#include "checkpoint_store.hpp"
#include "pause_token.hpp"

enum class ProgressEvent : std::uint8_t { Completed, Skipped, Failed };

struct ProgressUpdate {
    int chunk_index = -1;
    int completed = 0;
    int failed = 0;
    int total = 0;
    ProgressEvent event = ProgressEvent::Completed;
};

// Progress sink. Must return promptly; exceptions are logged and dropped.
using ProgressCallback = std::function<void(const ProgressUpdate&)>;

struct RunOutcome {
    JobStatus status = JobStatus::Idle;     // paused or completed
    std::vector<ChunkResult> results;       // sorted by chunk index
    JobSummary summary;
};

// Drives the sequential chunk loop for one job at a time and owns the job
// state machine:
//
//   idle -> processing                 start_new_job
//   processing -> paused               pause observed at a chunk boundary
//   processing -> completed            every chunk completed or failed recoverably
//   processing -> crashed              fatal processor error / checkpoint failure
//   paused|crashed -> processing       resume
//
// The record is checkpointed after every chunk attempt, so at most the
// in-flight chunk is lost on a crash. While the on-disk status is processing
// this executor holds the job's run lock.
class ResumableExecutor {
public:
    ResumableExecutor(CheckpointStore& store, ChunkProcessor processor);

    ResumableExecutor(const ResumableExecutor&) = delete;
    ResumableExecutor& operator=(const ResumableExecutor&) = delete;

    // AlreadyExists if a processing, paused or crashed record exists for the
    // derived job id (clear it first), or another process is driving it.
    Result<JobRecord> start_new_job(const std::vector<ChunkDescriptor>& descriptors,
                                    const std::string& name, const JobConfig& config,
                                    double estimated_cost = 0.0);

    // Reload a paused or crashed job. Returns the pending chunk indices
    // (including previously failed ones). NotResumable / ShapeMismatch leave
    // the record untouched.
    Result<std::vector<int>> resume(const std::string& job_id,
                                    const std::vector<ChunkDescriptor>& descriptors);

    // Main loop over the active job. Recoverable chunk failures are absorbed
    // into the record; a fatal one returns FatalJobFailure after the crash
    // checkpoint.
    Result<RunOutcome> process_all(const std::vector<ChunkDescriptor>& descriptors,
                                   ProgressCallback on_progress = nullptr);

    // Safe from any thread. Takes effect before the next chunk starts.
    void request_pause() { pause_.request(); }
    PauseToken& pause_token() { return pause_; }

    Result<JobRecord> current_state(const std::string& job_id) { return store_.read(job_id); }
    bool is_resumable(const std::string& job_id) { return store_.is_resumable(job_id); }
    Result<JobSummary> summarize(const std::string& job_id) { return store_.summarize(job_id); }

    // Discard a job's durable state. AlreadyExists while this executor is
    // running it or another owner holds its run lock.
    Result<void> clear(const std::string& job_id);

    // Idle when no job is loaded.
    JobStatus state() const { return status_.load(); }
    std::string active_job_id() const;

private:
    CheckpointStore& store_;
    ChunkProcessor processor_;
    PauseToken pause_;

    std::optional<JobRecord> job_;          // last successfully checkpointed record
    std::unique_ptr<FileLock> run_lock_;
    std::atomic<JobStatus> status_{JobStatus::Idle};
    std::atomic<bool> running_{false};

    Result<void> check_shape(const std::string& job_id, int total_chunks,
                             const std::vector<ChunkDescriptor>& descriptors) const;

    // Persist `next`; on success it becomes the in-memory record.
    Result<void> checkpoint(const JobRecord& next);

    // Crash checkpoint, release ownership, build the error to propagate.
    // chunk_index names the chunk that failed fatally, -1 for job-level errors.
    Result<RunOutcome> fail_job(ErrorKind kind, const std::string& error, int chunk_index = -1);

    Result<RunOutcome> finish(JobStatus status);

    Result<ChunkOutput> invoke_processor(const ChunkDescriptor& descriptor);
    void notify(const ProgressCallback& cb, int chunk_index, ProgressEvent event) const;
    void log(const std::string& msg) const;
};
