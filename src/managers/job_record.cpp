#include "job_record.hpp"
#include <fmt/format.h>
#include <algorithm>
#include <set>

const char* job_status_name(JobStatus status) {
    switch (status) {
        case JobStatus::Idle:       return "idle";
        case JobStatus::Processing: return "processing";
        case JobStatus::Paused:     return "paused";
        case JobStatus::Completed:  return "completed";
        case JobStatus::Crashed:    return "crashed";
    }
    return "unknown";
}

bool parse_job_status(const std::string& name, JobStatus& out) {
    static const std::map<std::string, JobStatus> names = {
        {"idle", JobStatus::Idle},
        {"processing", JobStatus::Processing},
        {"paused", JobStatus::Paused},
        {"completed", JobStatus::Completed},
        {"crashed", JobStatus::Crashed},
    };
    auto it = names.find(name);
    if (it == names.end()) return false;
    out = it->second;
    return true;
}

bool is_resumable_status(JobStatus status) {
    return status == JobStatus::Paused || status == JobStatus::Crashed;
}

// ── JobRecord ──────────────────────────────────────────────

bool JobRecord::is_completed(int chunk_index) const {
    return std::binary_search(completed_chunks.begin(), completed_chunks.end(), chunk_index);
}

std::vector<int> JobRecord::pending_chunks() const {
    std::vector<int> pending;
    for (int i = 0; i < total_chunks; ++i) {
        if (!is_completed(i)) pending.push_back(i);
    }
    return pending;
}

double JobRecord::progress_pct() const {
    if (total_chunks == 0) return 0.0;
    return 100.0 * static_cast<double>(completed_chunks.size()) / total_chunks;
}

JobSummary summarize_record(const JobRecord& record) {
    JobSummary s;
    s.job_id = record.job_id;
    s.name = record.name;
    s.status = record.status;
    s.completed = static_cast<int>(record.completed_chunks.size());
    s.total = record.total_chunks;
    s.failed = static_cast<int>(record.failed_chunks.size());
    s.progress_pct = record.progress_pct();
    s.estimated_cost = record.estimated_cost;
    s.actual_cost = record.actual_cost;
    s.total_input_tokens = record.total_input_tokens;
    s.total_output_tokens = record.total_output_tokens;
    s.created_at = record.created_at;
    s.last_updated = record.last_updated;
    return s;
}

// ── Checkpoint-time constructors ───────────────────────────

JobRecord with_chunk_result(const JobRecord& record, const ChunkResult& result) {
    JobRecord next = record;

    auto pos = std::lower_bound(next.completed_chunks.begin(), next.completed_chunks.end(),
                                result.chunk_index);
    if (pos == next.completed_chunks.end() || *pos != result.chunk_index) {
        next.completed_chunks.insert(pos, result.chunk_index);
    }
    next.failed_chunks.erase(result.chunk_index);

    auto it = std::lower_bound(next.results.begin(), next.results.end(), result.chunk_index,
                               [](const ChunkResult& r, int idx) { return r.chunk_index < idx; });
    if (it != next.results.end() && it->chunk_index == result.chunk_index) {
        next.actual_cost -= it->cost;
        next.total_input_tokens -= it->input_tokens;
        next.total_output_tokens -= it->output_tokens;
        *it = result;
    } else {
        next.results.insert(it, result);
    }

    next.actual_cost += result.cost;
    next.total_input_tokens += result.input_tokens;
    next.total_output_tokens += result.output_tokens;
    return next;
}

JobRecord with_chunk_failure(const JobRecord& record, int chunk_index, const std::string& error) {
    JobRecord next = record;
    next.failed_chunks[chunk_index] = error;
    return next;
}

JobRecord with_status(const JobRecord& record, JobStatus status) {
    JobRecord next = record;
    next.status = status;
    return next;
}

JobRecord with_crash(const JobRecord& record, const std::string& error, int chunk_index) {
    JobRecord next = record;
    if (chunk_index >= 0) next.failed_chunks.erase(chunk_index);
    next.status = JobStatus::Crashed;
    next.last_error = error;
    return next;
}

// ── Validation ─────────────────────────────────────────────

Result<void> validate_record(const JobRecord& record) {
    auto invalid = [&](const std::string& why) {
        return Result<void>::Err(ErrorKind::CorruptState,
                                 fmt::format("record '{}': {}", record.job_id, why));
    };

    if (record.schema_version != RECORD_SCHEMA_VERSION) {
        return invalid(fmt::format("unsupported schema version {}", record.schema_version));
    }
    if (record.job_id.empty()) return invalid("empty job id");
    if (record.total_chunks < 0) return invalid("negative total_chunks");
    if (record.status == JobStatus::Idle) return invalid("idle status is never persisted");

    int prev = -1;
    for (int idx : record.completed_chunks) {
        if (idx < 0 || idx >= record.total_chunks) {
            return invalid(fmt::format("completed chunk {} outside [0, {})", idx, record.total_chunks));
        }
        if (idx <= prev) return invalid("completed chunks not sorted/unique");
        prev = idx;
    }

    for (const auto& [idx, msg] : record.failed_chunks) {
        if (idx < 0 || idx >= record.total_chunks) {
            return invalid(fmt::format("failed chunk {} outside [0, {})", idx, record.total_chunks));
        }
        if (record.is_completed(idx)) {
            return invalid(fmt::format("chunk {} both completed and failed", idx));
        }
    }

    std::set<int> seen;
    for (const auto& r : record.results) {
        if (!record.is_completed(r.chunk_index)) {
            return invalid(fmt::format("result for chunk {} which is not completed", r.chunk_index));
        }
        if (!seen.insert(r.chunk_index).second) {
            return invalid(fmt::format("duplicate result for chunk {}", r.chunk_index));
        }
    }

    if (!record.created_at.empty() && !record.last_updated.empty() &&
        record.last_updated < record.created_at) {
        return invalid("last_updated precedes created_at");
    }

    return Result<void>::Ok();
}
