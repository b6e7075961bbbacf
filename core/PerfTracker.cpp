#include "core/PerfTracker.hpp"

#include <cstdlib>
#include <new>

// Debug builds route global new/delete through malloc so every allocation made
// while the frame driver is probing gets counted.
#ifndef NDEBUG

namespace {
void *CountedAlloc(const std::size_t size) {
  perf::g_allocCounter.fetch_add(1, std::memory_order_relaxed);
  perf::g_allocBytes.fetch_add(size, std::memory_order_relaxed);
  void *ptr = std::malloc(size == 0 ? 1 : size);
  if (!ptr) {
    throw std::bad_alloc();
  }
  return ptr;
}
} // namespace

void *operator new(std::size_t size) { return CountedAlloc(size); }

void *operator new[](std::size_t size) { return CountedAlloc(size); }

void operator delete(void *ptr) noexcept { std::free(ptr); }

void operator delete[](void *ptr) noexcept { std::free(ptr); }

void operator delete(void *ptr, std::size_t) noexcept { std::free(ptr); }

void operator delete[](void *ptr, std::size_t) noexcept { std::free(ptr); }

#endif
