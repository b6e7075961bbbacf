#include "core/Rng.hpp"

namespace core {
uint32_t NextU32(uint32_t& state) {
    // Xorshift32; a zero state would lock the generator at zero.
    if (state == 0u) {
        state = 0xA341316Cu;
    }
    state ^= state << 13;
    state ^= state >> 17;
    state ^= state << 5;
    return state;
}

float NextFloat01(uint32_t& state) {
    constexpr float invMaxU32 = 1.0f / 4294967295.0f;
    return static_cast<float>(NextU32(state)) * invMaxU32;
}

float NextRange(uint32_t& state, const float minValue, const float maxValue) {
    const float value = minValue + (maxValue - minValue) * NextFloat01(state);
    // Float rounding of the scale can land a hair outside the range.
    if (value < minValue) return minValue;
    if (value > maxValue) return maxValue;
    return value;
}

uint32_t NormalizeSeed(const uint32_t seed) { return (seed == 0u) ? 1u : seed; }
}  // namespace core
