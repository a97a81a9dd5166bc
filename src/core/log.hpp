#pragma once

#include <string>
#include <filesystem>

// Debug log: <temp>/chunkpoint_debug.log unless CHUNKPOINT_LOG or
// set_log_path() says otherwise.
std::string chunkpoint_log_path();
void set_log_path(const std::string& path);

// Append a "[HH:MM:SS.mmm] msg" line to the debug log.
void chunkpoint_log(const std::string& msg);

// Persistent job log path: <log_dir>/{job_id}.log
std::filesystem::path job_log_path(const std::filesystem::path& log_dir,
                                   const std::string& job_id);

// Append a timestamped line to a job's persistent log file.
void append_job_log(const std::filesystem::path& log_dir, const std::string& job_id,
                    const std::string& msg);
