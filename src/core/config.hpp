#pragma once

#include <string>
#include <optional>
#include <filesystem>
#include "types.hpp"

namespace fs = std::filesystem;

struct LockSettings {
    int timeout_ms = 10000;
    int poll_ms = 50;
};

struct ProcessorDefaults {
    std::string model;
    std::string provider;
    double temperature = 0.3;
    int max_tokens = 4096;
    std::string output_language;
};

struct ChunkingDefaults {
    int chunk_size = 2000;     // characters per chunk
    int overlap = 200;         // characters of preceding context
};

class Config {
public:
    // Load ~/.chunkpoint/config.yaml. A missing file yields defaults.
    static Result<Config> load_global();

    // Load an explicit config file. A missing file yields defaults.
    static Result<Config> load_file(const fs::path& path);

    // Defaults only (no file)
    static Config defaults();

    // Accessors
    const fs::path& state_dir() const { return state_dir_; }
    const LockSettings& lock() const { return lock_; }
    const ProcessorDefaults& processor() const { return processor_; }
    const ChunkingDefaults& chunking() const { return chunking_; }
    std::optional<std::string> log_file() const { return log_file_; }

    // Flatten processor + chunking settings into the configuration bag
    // recorded on every new job.
    JobConfig job_config_bag() const;

    Config() = default;

private:
    fs::path state_dir_;
    LockSettings lock_;
    ProcessorDefaults processor_;
    ChunkingDefaults chunking_;
    std::optional<std::string> log_file_;
};

// Get paths
fs::path get_chunkpoint_root();
fs::path get_global_config_path();
fs::path get_default_state_dir();

bool global_config_exists();

// Create default global config (never overwrites an existing one)
Result<void> create_default_global_config();
