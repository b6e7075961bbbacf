#include "sim/PhaseMachine.hpp"

#include "core/Log.hpp"

ActivationOutcome ResolveActivation(const Phase current) {
  ActivationOutcome outcome{};
  switch (current) {
  case Phase::Ready:
    outcome.next = Phase::Running;
    outcome.resetRun = true;
    outcome.applyImpulse = true;
    break;
  case Phase::Running:
    outcome.next = Phase::Running;
    outcome.applyImpulse = true;
    break;
  case Phase::Over:
    outcome.next = Phase::Running;
    outcome.resetRun = true;
    break;
  }
  return outcome;
}

void ResetRun(SimState &state, const Tuning &tuning) {
  state.phase = Phase::Running;
  state.bodyY = tuning.fieldHeight * 0.5f;
  state.bodyVelocity = 0.0f;
  state.obstacles = {};
  state.frameCount = 0;
  state.spawnTimer = 0;
  state.score = 0;
  state.obstaclesSpawned = 0;
  state.endCause = EndCause::None;
}

void EndRun(SimState &state, const EndCause cause) {
  state.phase = Phase::Over;
  state.endCause = cause;
  state.events.collided = true;
  if (state.score > state.bestScore) {
    state.bestScore = state.score;
    state.events.newBestScore = true;
  }
  LOG_DEBUG("Run over: {} after {} ticks, score {} (best {})",
            EndCauseName(cause), state.frameCount, state.score,
            state.bestScore);
}

const char *PhaseName(const Phase phase) {
  switch (phase) {
  case Phase::Ready:
    return "ready";
  case Phase::Running:
    return "running";
  case Phase::Over:
    return "over";
  }
  return "unknown";
}

const char *EndCauseName(const EndCause cause) {
  switch (cause) {
  case EndCause::None:
    return "none";
  case EndCause::Ground:
    return "ground";
  case EndCause::Ceiling:
    return "ceiling";
  case EndCause::Obstacle:
    return "obstacle";
  }
  return "unknown";
}
