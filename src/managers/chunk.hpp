#pragma once

#include <string>
#include <vector>
#include <functional>
#include <cstdint>
#include <core/types.hpp>

// One independently processable piece of the input. Read-only to the engine.
struct ChunkDescriptor {
    int index = 0;
    std::string text;
    std::string context;        // tail of the preceding chunk, may be empty
};

// What a chunk processor hands back on success.
struct ChunkOutput {
    std::string text;
    std::int64_t input_tokens = 0;
    std::int64_t output_tokens = 0;
    double cost = 0.0;
    std::string model;          // provenance
    std::string provider;
};

// External per-chunk transformation. Owns its own retry policy; failures are
// reported through Result with an ErrorKind that is_recoverable() classifies.
using ChunkProcessor =
    std::function<Result<ChunkOutput>(const ChunkDescriptor&, const JobConfig&)>;

// Stable job identifier over the whole input: FNV-1a over the chunk count and
// every descriptor's index and text, in index order. Same input, same id.
std::string derive_job_id(const std::vector<ChunkDescriptor>& descriptors);
