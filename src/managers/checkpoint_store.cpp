#include "checkpoint_store.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <algorithm>
#include <cctype>
#include <fstream>
#include <set>
#include <sstream>

// ── Encoding ───────────────────────────────────────────────

static std::string encode_record(const JobRecord& r) {
    YAML::Emitter out;
    out.SetDoublePrecision(17);
    out << YAML::BeginMap;

    out << YAML::Key << "schema_version" << YAML::Value << r.schema_version;
    out << YAML::Key << "job_id" << YAML::Value << r.job_id;
    out << YAML::Key << "name" << YAML::Value << r.name;
    out << YAML::Key << "status" << YAML::Value << job_status_name(r.status);
    out << YAML::Key << "created_at" << YAML::Value << r.created_at;
    out << YAML::Key << "last_updated" << YAML::Value << r.last_updated;

    out << YAML::Key << "config" << YAML::Value << YAML::BeginMap;
    for (const auto& [key, val] : r.config) {
        out << YAML::Key << key << YAML::Value << val;
    }
    out << YAML::EndMap;

    out << YAML::Key << "total_chunks" << YAML::Value << r.total_chunks;
    out << YAML::Key << "completed_chunks" << YAML::Value << YAML::Flow << r.completed_chunks;

    out << YAML::Key << "failed_chunks" << YAML::Value << YAML::BeginMap;
    for (const auto& [idx, msg] : r.failed_chunks) {
        out << YAML::Key << idx << YAML::Value << msg;
    }
    out << YAML::EndMap;

    out << YAML::Key << "results" << YAML::Value << YAML::BeginSeq;
    for (const auto& c : r.results) {
        out << YAML::BeginMap;
        out << YAML::Key << "chunk_index" << YAML::Value << c.chunk_index;
        out << YAML::Key << "input_chars" << YAML::Value << c.input_chars;
        out << YAML::Key << "output_chars" << YAML::Value << c.output_chars;
        out << YAML::Key << "input_tokens" << YAML::Value << c.input_tokens;
        out << YAML::Key << "output_tokens" << YAML::Value << c.output_tokens;
        out << YAML::Key << "cost" << YAML::Value << c.cost;
        out << YAML::Key << "model" << YAML::Value << c.model;
        out << YAML::Key << "provider" << YAML::Value << c.provider;
        // The emitter rewrites invalid UTF-8, so raw payloads go out as !!binary.
        if (is_valid_utf8(c.output)) {
            out << YAML::Key << "output" << YAML::Value << c.output;
        } else {
            out << YAML::Key << "output_binary" << YAML::Value
                << YAML::Binary(reinterpret_cast<const unsigned char*>(c.output.data()),
                                c.output.size());
        }
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;

    out << YAML::Key << "estimated_cost" << YAML::Value << r.estimated_cost;
    out << YAML::Key << "actual_cost" << YAML::Value << r.actual_cost;
    out << YAML::Key << "total_input_tokens" << YAML::Value << r.total_input_tokens;
    out << YAML::Key << "total_output_tokens" << YAML::Value << r.total_output_tokens;
    out << YAML::Key << "last_error" << YAML::Value << r.last_error;

    out << YAML::EndMap;
    return std::string(out.c_str()) + "\n";
}

template <typename T>
static T require(const YAML::Node& node, const char* key) {
    if (!node[key]) {
        throw YAML::Exception(YAML::Mark::null_mark(), fmt::format("missing key '{}'", key));
    }
    return node[key].as<T>();
}

// Throws YAML::Exception on structural problems.
static JobRecord decode_record(const YAML::Node& root) {
    if (!root.IsMap()) {
        throw YAML::Exception(YAML::Mark::null_mark(), "top level is not a mapping");
    }

    JobRecord r;
    r.schema_version = require<int>(root, "schema_version");
    r.job_id = require<std::string>(root, "job_id");
    r.name = root["name"].as<std::string>("");

    std::string status = require<std::string>(root, "status");
    if (!parse_job_status(status, r.status)) {
        throw YAML::Exception(YAML::Mark::null_mark(), "unknown status '" + status + "'");
    }

    r.created_at = require<std::string>(root, "created_at");
    r.last_updated = require<std::string>(root, "last_updated");

    if (root["config"] && root["config"].IsMap()) {
        for (const auto& kv : root["config"]) {
            r.config[kv.first.as<std::string>()] = kv.second.as<std::string>("");
        }
    }

    r.total_chunks = require<int>(root, "total_chunks");
    r.completed_chunks = require<std::vector<int>>(root, "completed_chunks");

    if (root["failed_chunks"] && root["failed_chunks"].IsMap()) {
        for (const auto& kv : root["failed_chunks"]) {
            r.failed_chunks[kv.first.as<int>()] = kv.second.as<std::string>("");
        }
    }

    if (root["results"] && root["results"].IsSequence()) {
        for (const auto& n : root["results"]) {
            ChunkResult c;
            c.chunk_index = require<int>(n, "chunk_index");
            c.input_chars = n["input_chars"].as<std::int64_t>(0);
            c.output_chars = n["output_chars"].as<std::int64_t>(0);
            c.input_tokens = n["input_tokens"].as<std::int64_t>(0);
            c.output_tokens = n["output_tokens"].as<std::int64_t>(0);
            c.cost = n["cost"].as<double>(0.0);
            c.model = n["model"].as<std::string>("");
            c.provider = n["provider"].as<std::string>("");
            if (n["output_binary"]) {
                auto bytes = n["output_binary"].as<YAML::Binary>();
                c.output.assign(reinterpret_cast<const char*>(bytes.data()), bytes.size());
            } else {
                c.output = n["output"].as<std::string>("");
            }
            r.results.push_back(c);
        }
    }

    r.estimated_cost = root["estimated_cost"].as<double>(0.0);
    r.actual_cost = root["actual_cost"].as<double>(0.0);
    r.total_input_tokens = root["total_input_tokens"].as<std::int64_t>(0);
    r.total_output_tokens = root["total_output_tokens"].as<std::int64_t>(0);
    r.last_error = root["last_error"].as<std::string>("");
    return r;
}

static bool read_file(const fs::path& path, std::string& out) {
    std::ifstream in(path, std::ios::binary);
    if (!in) return false;
    std::ostringstream ss;
    ss << in.rdbuf();
    out = ss.str();
    return true;
}

// Parse + validate one state file.
static Result<JobRecord> load_record_file(const fs::path& path, const std::string& job_id) {
    std::string content;
    if (!read_file(path, content)) {
        return Result<JobRecord>::Err(ErrorKind::NotFound, path.string() + ": cannot open");
    }

    JobRecord record;
    try {
        record = decode_record(YAML::Load(content));
    } catch (const YAML::Exception& e) {
        return Result<JobRecord>::Err(ErrorKind::CorruptState,
                                      fmt::format("{}: {}", path.string(), e.what()));
    }

    auto valid = validate_record(record);
    if (valid.is_err()) {
        return Result<JobRecord>::Err(ErrorKind::CorruptState,
                                      fmt::format("{}: {}", path.string(), valid.error));
    }
    if (record.job_id != job_id) {
        return Result<JobRecord>::Err(ErrorKind::CorruptState,
                                      fmt::format("{}: holds job '{}'", path.string(), record.job_id));
    }

    return Result<JobRecord>::Ok(record);
}

// Job ids become file names.
static bool valid_job_id(const std::string& job_id) {
    if (job_id.empty() || job_id[0] == '.') return false;
    return std::all_of(job_id.begin(), job_id.end(), [](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_' || c == '.';
    });
}

// ── CheckpointStore ────────────────────────────────────────

CheckpointStore::CheckpointStore(const fs::path& state_dir, StoreOptions options)
    : state_dir_(state_dir), options_(options) {
    std::error_code ec;
    fs::create_directories(state_dir_, ec);
}

fs::path CheckpointStore::primary_path(const std::string& job_id) const {
    return state_dir_ / fmt::format(PRIMARY_FILE_FMT, job_id);
}

fs::path CheckpointStore::backup_path(const std::string& job_id) const {
    return state_dir_ / fmt::format(BACKUP_FILE_FMT, job_id);
}

fs::path CheckpointStore::staging_path(const std::string& job_id) const {
    return state_dir_ / fmt::format(STAGING_FILE_FMT, job_id);
}

fs::path CheckpointStore::lock_path(const std::string& job_id) const {
    return state_dir_ / fmt::format(LOCK_FILE_FMT, job_id);
}

fs::path CheckpointStore::run_lock_path(const std::string& job_id) const {
    return state_dir_ / fmt::format(RUN_LOCK_FILE_FMT, job_id);
}

void CheckpointStore::log(const std::string& job_id, const std::string& msg) const {
    chunkpoint_log(fmt::format("[store {}] {}", job_id, msg));
    append_job_log(log_dir(), job_id, msg);
}

Result<std::unique_ptr<FileLock>> CheckpointStore::lock_job(const std::string& job_id) {
    if (!valid_job_id(job_id)) {
        return Result<std::unique_ptr<FileLock>>::Err(
            ErrorKind::InvalidConfig, fmt::format("invalid job id '{}'", job_id));
    }

    auto lock = std::make_unique<FileLock>(lock_path(job_id).string(),
                                           options_.lock_timeout_ms, options_.lock_poll_ms);
    if (!lock->held()) {
        chunkpoint_log(fmt::format("[store {}] lock timeout after {}ms", job_id,
                                   options_.lock_timeout_ms));
        return Result<std::unique_ptr<FileLock>>::Err(
            ErrorKind::LockTimeout,
            fmt::format("could not lock job '{}' within {}ms", job_id, options_.lock_timeout_ms));
    }
    return Result<std::unique_ptr<FileLock>>::Ok(std::move(lock));
}

Result<JobRecord> CheckpointStore::read(const std::string& job_id) {
    auto lock = lock_job(job_id);
    if (lock.is_err()) return Result<JobRecord>::Err(lock);
    return read_locked(job_id);
}

Result<JobRecord> CheckpointStore::read_locked(const std::string& job_id) {
    fs::path primary = primary_path(job_id);
    fs::path backup = backup_path(job_id);

    std::error_code ec;
    bool have_primary = fs::exists(primary, ec);
    bool have_backup = fs::exists(backup, ec);
    if (!have_primary && !have_backup) {
        return Result<JobRecord>::Err(ErrorKind::NotFound,
                                      fmt::format("no record for job '{}'", job_id));
    }

    std::string primary_error = "missing";
    if (have_primary) {
        auto result = load_record_file(primary, job_id);
        if (result.is_ok()) return result;
        primary_error = result.error;
    }

    log(job_id, fmt::format("primary unusable ({}), falling back to backup", primary_error));

    if (have_backup) {
        auto result = load_record_file(backup, job_id);
        if (result.is_ok()) {
            log(job_id, "recovered record from backup");
            return result;
        }
        log(job_id, fmt::format("backup unusable ({})", result.error));
        return Result<JobRecord>::Err(
            ErrorKind::CorruptState,
            fmt::format("job '{}': primary and backup both invalid: {}; {}",
                        job_id, primary_error, result.error));
    }

    return Result<JobRecord>::Err(
        ErrorKind::CorruptState,
        fmt::format("job '{}': primary invalid and no backup: {}", job_id, primary_error));
}

Result<JobRecord> CheckpointStore::write(const JobRecord& record) {
    auto lock = lock_job(record.job_id);
    if (lock.is_err()) return Result<JobRecord>::Err(lock);
    return write_locked(record);
}

Result<JobRecord> CheckpointStore::write_locked(const JobRecord& record) {
    const std::string& job_id = record.job_id;
    fs::path primary = primary_path(job_id);
    fs::path backup = backup_path(job_id);
    fs::path staging = staging_path(job_id);

    JobRecord stamped = record;
    std::string now = now_iso();
    if (stamped.created_at.empty()) stamped.created_at = now;
    stamped.last_updated = std::max(now, record.last_updated);

    // Only a primary that still validates may replace the backup. Bytes this
    // store wrote itself were validated then; anything else is parsed again.
    std::string previous_bytes;
    bool previous_ok = false;
    if (read_file(primary, previous_bytes)) {
        std::string previous_updated;
        {
            std::lock_guard<std::mutex> guard(written_mutex_);
            auto it = last_written_.find(job_id);
            if (it != last_written_.end() && it->second.bytes == previous_bytes) {
                previous_ok = true;
                previous_updated = it->second.last_updated;
            }
        }
        if (!previous_ok) {
            auto previous = load_record_file(primary, job_id);
            if (previous.is_ok()) {
                previous_ok = true;
                previous_updated = previous.value.last_updated;
            }
        }
        if (previous_ok) stamped.last_updated = std::max(stamped.last_updated, previous_updated);
    }

    auto valid = validate_record(stamped);
    if (valid.is_err()) {
        return Result<JobRecord>::Err(ErrorKind::Internal, "refusing to write: " + valid.error);
    }

    std::string encoded = encode_record(stamped);
    std::string error;

    try {
        fs::create_directories(state_dir_);

        if (previous_ok) {
            fs::path backup_staging = state_dir_ / ("." + backup.filename().string() + ".tmp");
            if (!platform::write_file_durable(backup_staging, previous_bytes, error)) {
                fs::remove(backup_staging);
                return Result<JobRecord>::Err(ErrorKind::IoError,
                                              fmt::format("backup of job '{}' failed: {}", job_id, error));
            }
            fs::rename(backup_staging, backup);
        }

        if (!platform::write_file_durable(staging, encoded, error)) {
            fs::remove(staging);
            return Result<JobRecord>::Err(ErrorKind::IoError,
                                          fmt::format("write of job '{}' failed: {}", job_id, error));
        }
        fs::rename(staging, primary);
    } catch (const fs::filesystem_error& e) {
        std::error_code ec;
        fs::remove(staging, ec);
        return Result<JobRecord>::Err(ErrorKind::IoError,
                                      fmt::format("write of job '{}' failed: {}", job_id, e.what()));
    }

    if (!platform::sync_dir(state_dir_)) {
        chunkpoint_log(fmt::format("[store {}] directory sync failed", job_id));
    }

    {
        std::lock_guard<std::mutex> guard(written_mutex_);
        last_written_[job_id] = WrittenFile{std::move(encoded), stamped.last_updated};
    }
    return Result<JobRecord>::Ok(stamped);
}

Result<JobRecord> CheckpointStore::create_new(const std::string& job_id, const std::string& name,
                                              int total_chunks, const JobConfig& config,
                                              double estimated_cost) {
    if (total_chunks < 0) {
        return Result<JobRecord>::Err(ErrorKind::ShapeMismatch,
                                      fmt::format("negative chunk count {}", total_chunks));
    }

    auto lock = lock_job(job_id);
    if (lock.is_err()) return Result<JobRecord>::Err(lock);

    auto existing = read_locked(job_id);
    if (existing.is_ok() && existing.value.status != JobStatus::Completed) {
        return Result<JobRecord>::Err(
            ErrorKind::AlreadyExists,
            fmt::format("job '{}' already exists with status {}; clear it first",
                        job_id, job_status_name(existing.value.status)));
    }
    if (existing.is_err() && existing.kind != ErrorKind::NotFound) {
        return Result<JobRecord>::Err(existing);
    }

    JobRecord record;
    record.job_id = job_id;
    record.name = name;
    record.status = JobStatus::Processing;
    record.created_at = now_iso();
    record.last_updated = record.created_at;
    record.config = config;
    record.total_chunks = total_chunks;
    record.estimated_cost = estimated_cost;

    auto written = write_locked(record);
    if (written.is_ok()) {
        log(job_id, fmt::format("created '{}' with {} chunks", name, total_chunks));
    }
    return written;
}

Result<void> CheckpointStore::clear(const std::string& job_id) {
    auto lock = lock_job(job_id);
    if (lock.is_err()) return Result<void>::Err(lock);

    fs::path backup = backup_path(job_id);
    std::vector<fs::path> targets = {
        primary_path(job_id),
        backup,
        staging_path(job_id),
        state_dir_ / ("." + backup.filename().string() + ".tmp"),
    };

    for (const auto& p : targets) {
        std::error_code ec;
        fs::remove(p, ec);
        if (ec) {
            return Result<void>::Err(ErrorKind::IoError,
                                     fmt::format("cannot remove {}: {}", p.string(), ec.message()));
        }
    }

    {
        std::lock_guard<std::mutex> guard(written_mutex_);
        last_written_.erase(job_id);
    }
    log(job_id, "cleared");
    return Result<void>::Ok();
}

bool CheckpointStore::is_resumable(const std::string& job_id) {
    auto record = read(job_id);
    if (record.is_err()) return false;
    const auto& r = record.value;
    return is_resumable_status(r.status) &&
           static_cast<int>(r.completed_chunks.size()) <= r.total_chunks;
}

Result<JobSummary> CheckpointStore::summarize(const std::string& job_id) {
    auto record = read(job_id);
    if (record.is_err()) return Result<JobSummary>::Err(record);
    return Result<JobSummary>::Ok(summarize_record(record.value));
}

std::vector<std::string> CheckpointStore::list_jobs() const {
    std::set<std::string> ids;
    std::error_code ec;
    for (fs::directory_iterator it(state_dir_, ec), end; !ec && it != end; it.increment(ec)) {
        if (!it->is_regular_file()) continue;
        std::string fname = it->path().filename().string();
        if (fname.empty() || fname[0] == '.') continue;

        const std::string backup_suffix = ".backup.yaml";
        const std::string primary_suffix = ".yaml";
        if (fname.size() > backup_suffix.size() &&
            fname.compare(fname.size() - backup_suffix.size(), backup_suffix.size(), backup_suffix) == 0) {
            ids.insert(fname.substr(0, fname.size() - backup_suffix.size()));
        } else if (fname.size() > primary_suffix.size() &&
                   fname.compare(fname.size() - primary_suffix.size(), primary_suffix.size(), primary_suffix) == 0) {
            ids.insert(fname.substr(0, fname.size() - primary_suffix.size()));
        }
    }
    return std::vector<std::string>(ids.begin(), ids.end());
}

Result<std::unique_ptr<FileLock>> CheckpointStore::claim_run(const std::string& job_id) const {
    if (!valid_job_id(job_id)) {
        return Result<std::unique_ptr<FileLock>>::Err(
            ErrorKind::InvalidConfig, fmt::format("invalid job id '{}'", job_id));
    }
    return Result<std::unique_ptr<FileLock>>::Ok(
        std::make_unique<FileLock>(run_lock_path(job_id).string()));
}

Result<JobRecord> CheckpointStore::recover_interrupted(const std::string& job_id) {
    auto lock = lock_job(job_id);
    if (lock.is_err()) return Result<JobRecord>::Err(lock);

    auto record = read_locked(job_id);
    if (record.is_err() || record.value.status != JobStatus::Processing) {
        return record;
    }

    auto owner = claim_run(job_id);
    if (owner.is_err()) return Result<JobRecord>::Err(owner);
    if (!owner.value->held()) {
        // A live process is still driving this job.
        return record;
    }

    log(job_id, "previous run ended without a final checkpoint; marking crashed");
    return write_locked(with_crash(record.value, "interrupted: run ended without a final checkpoint"));
}
