#include "game/Game.hpp"

#include "core/Log.hpp"
#include "sim/Sim.hpp"

namespace {

void MergeTickEvents(TickEvents &into, const TickEvents &tick) {
  into.runStarted |= tick.runStarted;
  into.runRestarted |= tick.runRestarted;
  into.impulseApplied |= tick.impulseApplied;
  into.obstacleSpawned |= tick.obstacleSpawned;
  into.scored += tick.scored;
  into.collided |= tick.collided;
  into.newBestScore |= tick.newBestScore;
}

} // namespace

void InitGame(Game &game, const uint32_t seed, const Tuning &tuning) {
  game.tuning = tuning;
  game.mailbox = {};
  game.accumulator = 0.0f;
  game.simTicks = 0;
  game.frameEvents = {};

  const int best = LoadBestScore(game.bestScorePath.c_str());
  game.sim = MakeInitialState(seed, best, game.tuning);
  LOG_INFO("Game ready (seed 0x{:08X}, best score {})", game.sim.runSeed,
           best);
}

void TickGame(Game &game) {
  const bool activate = TakeActivation(game.mailbox);
  game.sim = SimStep(game.sim, activate, game.tuning);
  ++game.simTicks;

  if (game.sim.events.newBestScore) {
    LOG_INFO("New best score: {}", game.sim.bestScore);
    if (!SaveBestScore(game.bestScorePath.c_str(), game.sim.bestScore)) {
      LOG_WARN("Best score {} kept for this session only", game.sim.bestScore);
    }
  }
}

int AdvanceFrame(Game &game, float frameTime) {
  if (frameTime > cfg::kMaxFrameTime) {
    frameTime = cfg::kMaxFrameTime;
  }
  game.accumulator += frameTime;
  game.frameEvents = {};

  int ticks = 0;
  while (game.accumulator >= cfg::kFixedDt && ticks < cfg::kMaxTicksPerFrame) {
    TickGame(game);
    MergeTickEvents(game.frameEvents, game.sim.events);
    game.accumulator -= cfg::kFixedDt;
    ++ticks;
  }

  // Fell too far behind; drop the backlog instead of spiralling.
  if (ticks == cfg::kMaxTicksPerFrame) {
    game.accumulator = 0.0f;
  }
  return ticks;
}
