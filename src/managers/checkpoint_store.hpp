#pragma once

#include <string>
#include <vector>
#include <memory>
#include <map>
#include <mutex>
#include <filesystem>
#include <core/types.hpp>
#include <core/constants.hpp>
#include <platform/file_lock.hpp>
#include "job_record.hpp"

namespace fs = std::filesystem;

struct StoreOptions {
    int lock_timeout_ms = LOCK_TIMEOUT_MS;
    int lock_poll_ms = LOCK_POLL_MS;
};

// Durable, crash-consistent storage of one JobRecord per job id.
//
// Layout under state_dir:
//   <id>.yaml           primary
//   <id>.backup.yaml    last primary that validated before being replaced
//   .<id>.yaml.tmp      write staging, renamed over the primary
//   <id>.lock           held for the duration of every read/write/clear
//   <id>.run.lock       held by the executor while it drives the job
//
// Every public operation takes <id>.lock (bounded wait, LockTimeout on expiry)
// and releases it on all exit paths.
class CheckpointStore {
public:
    explicit CheckpointStore(const fs::path& state_dir, StoreOptions options = {});

    // Last durably written record. Falls back to the backup when the primary
    // is unreadable or fails validation; CorruptState when both are bad.
    Result<JobRecord> read(const std::string& job_id);

    // Atomically replaces the primary. Returns the record as persisted
    // (last_updated stamped, never earlier than the previous value).
    Result<JobRecord> write(const JobRecord& record);

    // New record in status processing. AlreadyExists if a processing, paused
    // or crashed record is present; a completed record is replaced.
    Result<JobRecord> create_new(const std::string& job_id, const std::string& name,
                                 int total_chunks, const JobConfig& config,
                                 double estimated_cost = 0.0);

    // Removes primary, backup and staging files.
    Result<void> clear(const std::string& job_id);

    // Record exists, validates, and is paused or crashed.
    bool is_resumable(const std::string& job_id);

    Result<JobSummary> summarize(const std::string& job_id);

    // Job ids with a primary or backup file, sorted.
    std::vector<std::string> list_jobs() const;

    // Non-blocking claim of the run-ownership lock. Check held() on the
    // returned lock; InvalidConfig for an unusable job id.
    Result<std::unique_ptr<FileLock>> claim_run(const std::string& job_id) const;

    // A record left in processing whose run lock is free belongs to a dead
    // process: mark it crashed so it can be resumed. Anything else is
    // returned unchanged.
    Result<JobRecord> recover_interrupted(const std::string& job_id);

    const fs::path& state_dir() const { return state_dir_; }
    fs::path log_dir() const { return state_dir_ / JOB_LOGS_DIR; }
    fs::path primary_path(const std::string& job_id) const;
    fs::path backup_path(const std::string& job_id) const;
    fs::path staging_path(const std::string& job_id) const;
    fs::path lock_path(const std::string& job_id) const;
    fs::path run_lock_path(const std::string& job_id) const;

private:
    fs::path state_dir_;
    StoreOptions options_;

    // Last bytes this store put in each primary, so a checkpoint need not
    // re-parse a file it wrote itself.
    struct WrittenFile {
        std::string bytes;
        std::string last_updated;
    };
    std::map<std::string, WrittenFile> last_written_;
    mutable std::mutex written_mutex_;

    Result<std::unique_ptr<FileLock>> lock_job(const std::string& job_id);

    // Callers hold the job lock.
    Result<JobRecord> read_locked(const std::string& job_id);
    Result<JobRecord> write_locked(const JobRecord& record);

    void log(const std::string& job_id, const std::string& msg) const;
};
