#include "resumable_executor.hpp"
#include <core/log.hpp>
#include <fmt/format.h>

namespace {

// Clears the running flag on every exit path of process_all.
class RunningGuard {
public:
    explicit RunningGuard(std::atomic<bool>& flag) : flag_(flag) { flag_.store(true); }
    ~RunningGuard() { flag_.store(false); }

    RunningGuard(const RunningGuard&) = delete;
    RunningGuard& operator=(const RunningGuard&) = delete;

private:
    std::atomic<bool>& flag_;
};

const char* event_name(ProgressEvent event) {
    switch (event) {
        case ProgressEvent::Completed: return "completed";
        case ProgressEvent::Skipped:   return "skipped";
        case ProgressEvent::Failed:    return "failed";
    }
    return "unknown";
}

} // namespace

ResumableExecutor::ResumableExecutor(CheckpointStore& store, ChunkProcessor processor)
    : store_(store), processor_(std::move(processor)) {}

std::string ResumableExecutor::active_job_id() const {
    return job_ ? job_->job_id : "";
}

void ResumableExecutor::log(const std::string& msg) const {
    if (!job_) {
        chunkpoint_log("[executor] " + msg);
        return;
    }
    chunkpoint_log(fmt::format("[executor {}] {}", job_->job_id, msg));
    append_job_log(store_.log_dir(), job_->job_id, msg);
}

// ── Start / resume ─────────────────────────────────────────

Result<void> ResumableExecutor::check_shape(const std::string& job_id, int total_chunks,
                                            const std::vector<ChunkDescriptor>& descriptors) const {
    if (static_cast<int>(descriptors.size()) != total_chunks) {
        return Result<void>::Err(ErrorKind::ShapeMismatch,
                                 fmt::format("job '{}' has {} chunks, got {} descriptors",
                                             job_id, total_chunks, descriptors.size()));
    }

    std::vector<bool> seen(descriptors.size(), false);
    for (const auto& d : descriptors) {
        if (d.index < 0 || d.index >= total_chunks || seen[d.index]) {
            return Result<void>::Err(ErrorKind::ShapeMismatch,
                                     fmt::format("descriptor index {} is out of range or repeated",
                                                 d.index));
        }
        seen[d.index] = true;
    }

    if (derive_job_id(descriptors) != job_id) {
        return Result<void>::Err(ErrorKind::ShapeMismatch,
                                 fmt::format("descriptors do not belong to job '{}'", job_id));
    }
    return Result<void>::Ok();
}

Result<JobRecord> ResumableExecutor::start_new_job(const std::vector<ChunkDescriptor>& descriptors,
                                                   const std::string& name,
                                                   const JobConfig& config,
                                                   double estimated_cost) {
    if (running_.load()) {
        return Result<JobRecord>::Err(ErrorKind::AlreadyExists, "executor is already processing a job");
    }

    std::string job_id = derive_job_id(descriptors);
    auto shape = check_shape(job_id, static_cast<int>(descriptors.size()), descriptors);
    if (shape.is_err()) return Result<JobRecord>::Err(shape);

    auto owner = store_.claim_run(job_id);
    if (owner.is_err()) return Result<JobRecord>::Err(owner);
    if (!owner.value->held()) {
        return Result<JobRecord>::Err(ErrorKind::AlreadyExists,
                                      fmt::format("job '{}' is being processed by another process", job_id));
    }

    auto created = store_.create_new(job_id, name, static_cast<int>(descriptors.size()),
                                     config, estimated_cost);
    if (created.is_err()) return created;

    run_lock_ = std::move(owner.value);
    job_ = created.value;
    pause_.reset();
    status_.store(JobStatus::Processing);
    log(fmt::format("started '{}' ({} chunks, estimated cost ${:.4f})",
                    name, descriptors.size(), estimated_cost));
    return created;
}

Result<std::vector<int>> ResumableExecutor::resume(const std::string& job_id,
                                                   const std::vector<ChunkDescriptor>& descriptors) {
    if (running_.load()) {
        return Result<std::vector<int>>::Err(ErrorKind::AlreadyExists,
                                             "executor is already processing a job");
    }

    // Shape first: a rejected resume must leave the record untouched, even
    // an orphaned processing one.
    auto stored = store_.read(job_id);
    if (stored.is_err()) return Result<std::vector<int>>::Err(stored);
    auto stored_shape = check_shape(job_id, stored.value.total_chunks, descriptors);
    if (stored_shape.is_err()) return Result<std::vector<int>>::Err(stored_shape);

    // A processing record whose owner died becomes crashed (and resumable).
    auto recovered = store_.recover_interrupted(job_id);
    if (recovered.is_err()) return Result<std::vector<int>>::Err(recovered);

    auto owner = store_.claim_run(job_id);
    if (owner.is_err()) return Result<std::vector<int>>::Err(owner);
    if (!owner.value->held()) {
        return Result<std::vector<int>>::Err(
            ErrorKind::NotResumable,
            fmt::format("job '{}' is being processed by another process", job_id));
    }

    auto record = store_.read(job_id);
    if (record.is_err()) return Result<std::vector<int>>::Err(record);

    if (!is_resumable_status(record.value.status)) {
        return Result<std::vector<int>>::Err(
            ErrorKind::NotResumable,
            fmt::format("job '{}' is {}; only paused or crashed jobs can be resumed",
                        job_id, job_status_name(record.value.status)));
    }

    auto shape = check_shape(job_id, record.value.total_chunks, descriptors);
    if (shape.is_err()) return Result<std::vector<int>>::Err(shape);

    JobRecord next = with_status(record.value, JobStatus::Processing);
    next.last_error.clear();
    auto written = store_.write(next);
    if (written.is_err()) return Result<std::vector<int>>::Err(written);

    run_lock_ = std::move(owner.value);
    job_ = written.value;
    pause_.reset();
    status_.store(JobStatus::Processing);

    auto pending = job_->pending_chunks();
    log(fmt::format("resumed from {}: {}/{} completed, {} pending",
                    job_status_name(record.value.status), job_->completed_chunks.size(),
                    job_->total_chunks, pending.size()));
    return Result<std::vector<int>>::Ok(pending);
}

// ── Main loop ──────────────────────────────────────────────

Result<ChunkOutput> ResumableExecutor::invoke_processor(const ChunkDescriptor& descriptor) {
    try {
        return processor_(descriptor, job_->config);
    } catch (const std::exception& e) {
        // Exceptions are programming errors, never transient.
        return Result<ChunkOutput>::Err(ErrorKind::Internal, e.what());
    }
}

void ResumableExecutor::notify(const ProgressCallback& cb, int chunk_index,
                               ProgressEvent event) const {
    if (!cb) return;
    ProgressUpdate update;
    update.chunk_index = chunk_index;
    update.completed = static_cast<int>(job_->completed_chunks.size());
    update.failed = static_cast<int>(job_->failed_chunks.size());
    update.total = job_->total_chunks;
    update.event = event;
    try {
        cb(update);
    } catch (const std::exception& e) {
        log(fmt::format("progress callback threw on chunk {} ({}): {}",
                        chunk_index, event_name(event), e.what()));
    }
}

Result<void> ResumableExecutor::checkpoint(const JobRecord& next) {
    auto written = store_.write(next);
    if (written.is_err()) return Result<void>::Err(written);
    job_ = written.value;
    return Result<void>::Ok();
}

Result<RunOutcome> ResumableExecutor::fail_job(ErrorKind kind, const std::string& error,
                                               int chunk_index) {
    std::string message = error;
    auto crashed = checkpoint(with_crash(*job_, error, chunk_index));
    if (crashed.is_err()) {
        job_ = with_crash(*job_, error, chunk_index);
        message += fmt::format("; crash checkpoint also failed: {}", crashed.error);
    }

    status_.store(JobStatus::Crashed);
    run_lock_.reset();
    log("crashed: " + message);
    return Result<RunOutcome>::Err(kind, message);
}

Result<RunOutcome> ResumableExecutor::finish(JobStatus status) {
    auto done = checkpoint(with_status(*job_, status));
    if (done.is_err()) {
        return fail_job(done.kind, fmt::format("final checkpoint ({}) failed: {}",
                                               job_status_name(status), done.error));
    }

    status_.store(status);
    run_lock_.reset();

    RunOutcome outcome;
    outcome.status = status;
    outcome.results = job_->results;
    outcome.summary = summarize_record(*job_);

    log(fmt::format("{}: {}/{} completed, {} failed, cost ${:.4f}",
                    job_status_name(status), outcome.summary.completed, outcome.summary.total,
                    outcome.summary.failed, outcome.summary.actual_cost));
    return Result<RunOutcome>::Ok(outcome);
}

Result<RunOutcome> ResumableExecutor::process_all(const std::vector<ChunkDescriptor>& descriptors,
                                                  ProgressCallback on_progress) {
    if (!job_ || status_.load() != JobStatus::Processing) {
        return Result<RunOutcome>::Err(
            ErrorKind::NotResumable,
            "no job in processing state; call start_new_job() or resume() first");
    }
    if (running_.load()) {
        return Result<RunOutcome>::Err(ErrorKind::AlreadyExists, "process_all is already running");
    }

    auto shape = check_shape(job_->job_id, job_->total_chunks, descriptors);
    if (shape.is_err()) return Result<RunOutcome>::Err(shape);

    RunningGuard guard(running_);

    std::vector<const ChunkDescriptor*> by_index(descriptors.size(), nullptr);
    for (const auto& d : descriptors) {
        by_index[d.index] = &d;
    }

    for (int idx = 0; idx < job_->total_chunks; ++idx) {
        if (pause_.requested()) {
            log(fmt::format("pause requested; stopping before chunk {}", idx));
            return finish(JobStatus::Paused);
        }

        if (job_->is_completed(idx)) {
            notify(on_progress, idx, ProgressEvent::Skipped);
            continue;
        }

        const ChunkDescriptor& descriptor = *by_index[idx];
        auto output = invoke_processor(descriptor);

        if (output.is_ok()) {
            ChunkResult result;
            result.chunk_index = idx;
            result.input_chars = static_cast<std::int64_t>(descriptor.text.size() +
                                                           descriptor.context.size());
            result.output_chars = static_cast<std::int64_t>(output.value.text.size());
            result.input_tokens = output.value.input_tokens;
            result.output_tokens = output.value.output_tokens;
            result.cost = output.value.cost;
            result.model = output.value.model;
            result.provider = output.value.provider;
            result.output = std::move(output.value.text);
            if (result.model.empty() && job_->config.count("model")) {
                result.model = job_->config.at("model");
            }
            if (result.provider.empty() && job_->config.count("provider")) {
                result.provider = job_->config.at("provider");
            }

            auto saved = checkpoint(with_chunk_result(*job_, result));
            if (saved.is_err()) {
                return fail_job(saved.kind, fmt::format("checkpoint after chunk {} failed: {}",
                                                        idx, saved.error));
            }
            log(fmt::format("chunk {} done ({} in / {} out tokens, ${:.4f})",
                            idx, result.input_tokens, result.output_tokens, result.cost));
            notify(on_progress, idx, ProgressEvent::Completed);
            continue;
        }

        std::string error = fmt::format("{}: {}", error_kind_name(output.kind), output.error);

        if (is_recoverable(output.kind)) {
            auto saved = checkpoint(with_chunk_failure(*job_, idx, error));
            if (saved.is_err()) {
                return fail_job(saved.kind, fmt::format("checkpoint after chunk {} failed: {}",
                                                        idx, saved.error));
            }
            log(fmt::format("chunk {} failed (recoverable), continuing: {}", idx, error));
            notify(on_progress, idx, ProgressEvent::Failed);
            continue;
        }

        return fail_job(ErrorKind::FatalJobFailure, fmt::format("chunk {}: {}", idx, error), idx);
    }

    return finish(JobStatus::Completed);
}

Result<void> ResumableExecutor::clear(const std::string& job_id) {
    bool ours = job_ && job_->job_id == job_id;
    if (ours && running_.load()) {
        return Result<void>::Err(ErrorKind::AlreadyExists,
                                 fmt::format("job '{}' is being processed", job_id));
    }

    // Another executor (in this or another process) driving the job holds its
    // run lock; keep our claim until the files are gone.
    std::unique_ptr<FileLock> owner;
    if (!ours || !run_lock_) {
        auto claimed = store_.claim_run(job_id);
        if (claimed.is_err()) return Result<void>::Err(claimed);
        owner = std::move(claimed.value);
        if (!owner->held()) {
            return Result<void>::Err(ErrorKind::AlreadyExists,
                                     fmt::format("job '{}' is being processed by another process",
                                                 job_id));
        }
    }

    auto cleared = store_.clear(job_id);
    if (cleared.is_err()) return cleared;

    if (ours) {
        log("cleared");
        job_.reset();
        run_lock_.reset();
        status_.store(JobStatus::Idle);
    }
    return cleared;
}
