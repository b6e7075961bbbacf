#pragma once

#include <cstdint>

#include "core/Tuning.hpp"
#include "sim/SimState.hpp"

// Snapshot in phase Ready with the body centred.
SimState MakeInitialState(uint32_t seed, int bestScore, const Tuning &tuning);

// One tick. Takes the previous snapshot by value and returns the next one;
// the caller's copy is never touched. `activate` is at most one coalesced
// activation for this tick.
SimState SimStep(SimState state, bool activate, const Tuning &tuning);

// Where to draw the body. While Ready it bobs around bodyY; the bob is never
// written back into a snapshot.
float DisplayBodyY(const SimState &state, double timeSeconds);
