#include "chunk.hpp"
#include <core/utils.hpp>
#include <algorithm>

std::string derive_job_id(const std::vector<ChunkDescriptor>& descriptors) {
    // Hash in index order so the id does not depend on how the caller
    // ordered the vector.
    std::vector<const ChunkDescriptor*> ordered;
    ordered.reserve(descriptors.size());
    for (const auto& d : descriptors) ordered.push_back(&d);
    std::stable_sort(ordered.begin(), ordered.end(),
                     [](const ChunkDescriptor* a, const ChunkDescriptor* b) {
                         return a->index < b->index;
                     });

    std::uint64_t h = fnv1a_64(std::to_string(descriptors.size()));
    for (const auto* d : ordered) {
        h = fnv1a_64(std::to_string(d->index) + ":", h);
        h = fnv1a_64(d->text, h);
        h = fnv1a_64("\n", h);
    }
    return to_hex64(h);
}
