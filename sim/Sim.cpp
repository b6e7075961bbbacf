#include "sim/Sim.hpp"

#include <cmath>

#include "core/Config.hpp"
#include "core/Log.hpp"
#include "core/Rng.hpp"
#include "sim/BodyPhysics.hpp"
#include "sim/Collision.hpp"
#include "sim/ObstacleStream.hpp"
#include "sim/PhaseMachine.hpp"

SimState MakeInitialState(const uint32_t seed, const int bestScore,
                          const Tuning &tuning) {
  SimState state{};
  state.phase = Phase::Ready;
  state.bodyY = tuning.fieldHeight * 0.5f;
  state.runSeed = core::NormalizeSeed(seed);
  state.rngState = state.runSeed;
  state.bestScore = (bestScore > 0) ? bestScore : 0;
  return state;
}

SimState SimStep(SimState state, const bool activate, const Tuning &tuning) {
  state.events = {};

  // 1. Phase transition driven by the activation.
  bool impulse = false;
  if (activate) {
    const Phase before = state.phase;
    const ActivationOutcome outcome = ResolveActivation(before);
    if (outcome.resetRun) {
      ResetRun(state, tuning);
      state.events.runStarted = (before == Phase::Ready);
      state.events.runRestarted = (before == Phase::Over);
      LOG_DEBUG("Run {} from {}", outcome.applyImpulse ? "started" : "restarted",
                PhaseName(before));
    }
    state.phase = outcome.next;
    impulse = outcome.applyImpulse;
  }

  // 2. Ready and Over hold still; the idle bob lives in DisplayBodyY.
  if (state.phase != Phase::Running) {
    return state;
  }

  // 3. Body, obstacles, tick counter.
  const BodyMotion body =
      IntegrateBody(BodyMotion{state.bodyY, state.bodyVelocity}, impulse, tuning);
  state.bodyY = body.y;
  state.bodyVelocity = body.velocity;
  state.events.impulseApplied = impulse;

  if (AdvanceObstacleStream(state.obstacles, state.spawnTimer, state.rngState,
                            tuning)) {
    state.events.obstacleSpawned = true;
    ++state.obstaclesSpawned;
  }
  ++state.frameCount;

  // 4. Scoring and collision.
  const DetectionResult hit =
      DetectCollisions(state.obstacles, state.bodyY, state.score, tuning);
  state.events.scored = hit.scored;

  // 5. Terminal hit ends the run.
  if (hit.collided) {
    EndRun(state, hit.cause);
  }
  return state;
}

float DisplayBodyY(const SimState &state, const double timeSeconds) {
  if (state.phase != Phase::Ready) {
    return state.bodyY;
  }
  const double swing = std::sin(timeSeconds / cfg::kIdleSwingPeriod) *
                       cfg::kIdleSwingAmplitude;
  return state.bodyY + static_cast<float>(swing);
}
