#pragma once

#include <cstdint>

// Explicit-state RNG. Callers own the state word, so any snapshot that carries
// it replays identically from the same seed.
namespace core {
uint32_t NextU32(uint32_t& state);
float NextFloat01(uint32_t& state);
// Uniform in [minValue, maxValue].
float NextRange(uint32_t& state, float minValue, float maxValue);
uint32_t NormalizeSeed(uint32_t seed);
}  // namespace core
