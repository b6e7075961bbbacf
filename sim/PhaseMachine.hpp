#pragma once

#include "core/Tuning.hpp"
#include "sim/SimState.hpp"

// What an activation does in a given phase.
struct ActivationOutcome {
  Phase next = Phase::Ready;
  bool resetRun = false;
  bool applyImpulse = false;
};

// Ready:   reset and flap on the same activation.
// Running: flap only.
// Over:    reset only; the next activation produces the first flap.
ActivationOutcome ResolveActivation(Phase current);

// Fresh run: body centred and at rest, no obstacles, counters and score at
// zero, phase Running. Keeps bestScore and the RNG stream.
void ResetRun(SimState &state, const Tuning &tuning);

// Running -> Over. Raises bestScore (and flags it in the tick events) when the
// run beat it.
void EndRun(SimState &state, EndCause cause);

const char *PhaseName(Phase phase);
const char *EndCauseName(EndCause cause);
