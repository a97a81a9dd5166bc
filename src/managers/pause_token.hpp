#pragma once

#include <atomic>

// Cooperative pause flag. Set from any thread; observed by the executor only
// at chunk boundaries, never inside a chunk.
class PauseToken {
public:
    void request() { requested_.store(true); }
    void reset() { requested_.store(false); }
    bool requested() const { return requested_.load(); }

private:
    std::atomic<bool> requested_{false};
};
