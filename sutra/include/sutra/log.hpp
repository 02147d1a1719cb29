#pragma once
// Log: process-wide verbosity for component diagnostics
//
// Components write "[Tag] message" lines to stderr directly.
// Call sites check enabled() first so quiet runs pay nothing.

#include <atomic>

namespace sutra {
namespace log {

enum class Level : int {
    Quiet = 0,
    Info = 1,
    Debug = 2
};

inline std::atomic<int>& level_storage() {
    static std::atomic<int> level{static_cast<int>(Level::Info)};
    return level;
}

inline void set_level(Level level) {
    level_storage().store(static_cast<int>(level), std::memory_order_relaxed);
}

inline Level level() {
    return static_cast<Level>(level_storage().load(std::memory_order_relaxed));
}

inline bool enabled(Level at = Level::Info) {
    return level_storage().load(std::memory_order_relaxed) >= static_cast<int>(at);
}

inline bool debug() { return enabled(Level::Debug); }

} // namespace log
} // namespace sutra
