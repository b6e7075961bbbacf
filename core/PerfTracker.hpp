#pragma once

#include <atomic>
#include <cstddef>

// Per-tick heap allocation probe for the frame driver.
// Live only in debug builds (NDEBUG not defined); release builds compile the
// calls away. SimStep copies a fixed-capacity snapshot, so any count above
// zero during the update points at a regression.

namespace perf {

#ifndef NDEBUG

inline std::atomic<int> g_allocCounter{0};
inline std::atomic<std::size_t> g_allocBytes{0};

inline void ResetAllocCounter() {
  g_allocCounter.store(0, std::memory_order_relaxed);
  g_allocBytes.store(0, std::memory_order_relaxed);
}
inline int ReadAllocCounter() {
  return g_allocCounter.load(std::memory_order_relaxed);
}
inline std::size_t ReadAllocBytes() {
  return g_allocBytes.load(std::memory_order_relaxed);
}

#else

inline void ResetAllocCounter() {}
inline int ReadAllocCounter() { return 0; }
inline std::size_t ReadAllocBytes() { return 0; }

#endif

} // namespace perf
