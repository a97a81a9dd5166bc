#include "config.hpp"
#include "constants.hpp"
#include "utils.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <fstream>

namespace fs = std::filesystem;

fs::path get_chunkpoint_root() {
    return platform::home_dir() / ".chunkpoint";
}

fs::path get_global_config_path() {
    return get_chunkpoint_root() / "config.yaml";
}

fs::path get_default_state_dir() {
    return get_chunkpoint_root() / "state";
}

bool global_config_exists() {
    return fs::exists(get_global_config_path());
}

Result<void> create_default_global_config() {
    fs::path config_path = get_global_config_path();

    // Don't overwrite existing config
    if (fs::exists(config_path)) {
        return Result<void>::Ok();
    }

    // Default config content
    const char* default_config = R"(# chunkpoint configuration

# Where job records, backups, locks and job logs live
state_dir: "~/.chunkpoint/state"

lock:
  timeout_ms: 10000                # give up with LockTimeout after this long
  poll_ms: 50

# Optional: debug log location (default: <tmp>/chunkpoint_debug.log)
# log_file: "/tmp/chunkpoint_debug.log"

# Recorded into every new job's configuration
processor:
  model: "claude-3-5-sonnet-20241022"
  provider: "anthropic"
  temperature: 0.3
  max_tokens: 4096
  output_language: "English"

chunking:
  chunk_size: 2000
  overlap: 200
)";

    try {
        fs::create_directories(config_path.parent_path());
        std::ofstream out(config_path);
        if (!out) {
            return Result<void>::Err(ErrorKind::IoError,
                                     "Failed to create config file at " + config_path.string());
        }
        out << default_config;
        out.close();
        return Result<void>::Ok();
    } catch (const std::exception& e) {
        return Result<void>::Err(ErrorKind::IoError,
                                 "Failed to write config file: " + std::string(e.what()));
    }
}

static LockSettings parse_lock_settings(const YAML::Node& node) {
    LockSettings lock;
    lock.timeout_ms = node["timeout_ms"].as<int>(LOCK_TIMEOUT_MS);
    lock.poll_ms = node["poll_ms"].as<int>(LOCK_POLL_MS);
    return lock;
}

static ProcessorDefaults parse_processor_defaults(const YAML::Node& node) {
    ProcessorDefaults p;
    p.model = node["model"].as<std::string>(DEFAULT_MODEL);
    p.provider = node["provider"].as<std::string>(DEFAULT_PROVIDER);
    p.temperature = node["temperature"].as<double>(DEFAULT_TEMPERATURE);
    p.max_tokens = node["max_tokens"].as<int>(DEFAULT_MAX_TOKENS);
    p.output_language = node["output_language"].as<std::string>(DEFAULT_OUTPUT_LANGUAGE);
    return p;
}

static ChunkingDefaults parse_chunking_defaults(const YAML::Node& node) {
    ChunkingDefaults c;
    c.chunk_size = node["chunk_size"].as<int>(DEFAULT_CHUNK_SIZE);
    c.overlap = node["overlap"].as<int>(DEFAULT_CHUNK_OVERLAP);
    return c;
}

Config Config::defaults() {
    Config config;
    config.state_dir_ = get_default_state_dir();
    config.processor_ = parse_processor_defaults(YAML::Node());
    config.chunking_ = parse_chunking_defaults(YAML::Node());
    config.lock_ = parse_lock_settings(YAML::Node());
    return config;
}

Result<Config> Config::load_global() {
    return load_file(get_global_config_path());
}

Result<Config> Config::load_file(const fs::path& path) {
    Config config = defaults();

    if (!fs::exists(path)) {
        return Result<Config>::Ok(config);
    }

    try {
        YAML::Node root = YAML::LoadFile(path.string());
        if (!root.IsNull() && !root.IsMap()) {
            return Result<Config>::Err(ErrorKind::InvalidConfig,
                                       fmt::format("{}: top level must be a mapping", path.string()));
        }

        if (root["state_dir"]) {
            config.state_dir_ = expand_user(root["state_dir"].as<std::string>());
        }
        if (root["lock"] && root["lock"].IsMap()) {
            config.lock_ = parse_lock_settings(root["lock"]);
        }
        if (root["processor"] && root["processor"].IsMap()) {
            config.processor_ = parse_processor_defaults(root["processor"]);
        }
        if (root["chunking"] && root["chunking"].IsMap()) {
            config.chunking_ = parse_chunking_defaults(root["chunking"]);
        }
        if (root["log_file"]) {
            config.log_file_ = expand_user(root["log_file"].as<std::string>()).string();
        }
    } catch (const YAML::Exception& e) {
        return Result<Config>::Err(ErrorKind::InvalidConfig,
                                   fmt::format("{}: {}", path.string(), e.what()));
    }

    if (config.lock_.timeout_ms < 0 || config.lock_.poll_ms <= 0) {
        return Result<Config>::Err(ErrorKind::InvalidConfig,
                                   fmt::format("{}: lock timeout must be >= 0 and poll > 0",
                                               path.string()));
    }
    if (config.chunking_.chunk_size <= 0 || config.chunking_.overlap < 0) {
        return Result<Config>::Err(ErrorKind::InvalidConfig,
                                   fmt::format("{}: chunk_size must be > 0 and overlap >= 0",
                                               path.string()));
    }

    return Result<Config>::Ok(config);
}

JobConfig Config::job_config_bag() const {
    JobConfig bag;
    bag["model"] = processor_.model;
    bag["provider"] = processor_.provider;
    bag["temperature"] = fmt::format("{}", processor_.temperature);
    bag["max_tokens"] = std::to_string(processor_.max_tokens);
    bag["output_language"] = processor_.output_language;
    bag["chunk_size"] = std::to_string(chunking_.chunk_size);
    bag["overlap"] = std::to_string(chunking_.overlap);
    return bag;
}
