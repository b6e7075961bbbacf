#include <cmath>
#include <cstdint>
#include <cstdio>
#include <iostream>
#include <string>

#include "core/Config.hpp"
#include "core/Log.hpp"
#include "core/Rng.hpp"
#include "core/Tuning.hpp"
#include "game/Game.hpp"
#include "sim/BodyPhysics.hpp"
#include "sim/Bot.hpp"
#include "sim/Collision.hpp"
#include "sim/Mailbox.hpp"
#include "sim/ObstacleStream.hpp"
#include "sim/PhaseMachine.hpp"
#include "sim/Sim.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

namespace {
bool NearlyEqual(const float a, const float b, const float eps = 1e-4f) {
  return std::fabs(a - b) <= eps;
}

const Tuning kTuning{};

// A run in progress: body centred and at rest, nothing on screen.
SimState MakeRunningState(const uint32_t seed = 42u) {
  SimState state = MakeInitialState(seed, 0, kTuning);
  ResetRun(state, kTuning);
  return state;
}

Obstacle MakeObstacle(const float x, const float gapCenterY,
                      const bool counted = false) {
  Obstacle o{};
  o.x = x;
  o.gapCenterY = gapCenterY;
  o.counted = counted;
  return o;
}

void Push(ObstacleList &list, const Obstacle &o) {
  list.items[list.count++] = o;
}

// Runs with no activation until the run ends or `maxTicks` pass.
SimState RunUntilOver(SimState state, const int maxTicks) {
  for (int i = 0; i < maxTicks && state.phase == Phase::Running; ++i) {
    state = SimStep(state, false, kTuning);
  }
  return state;
}

// --- Body physics ---

bool TestGravityAccumulates() {
  const BodyMotion next = IntegrateBody(BodyMotion{100.0f, 0.0f}, false, kTuning);
  return NearlyEqual(next.velocity, cfg::kGravity) &&
         NearlyEqual(next.y, 100.0f + cfg::kGravity);
}

bool TestTerminalVelocityClamp() {
  const BodyMotion next = IntegrateBody(BodyMotion{100.0f, 9.9f}, false, kTuning);
  return next.velocity == cfg::kMaxDropSpeed &&
         NearlyEqual(next.y, 100.0f + cfg::kMaxDropSpeed);
}

bool TestNoUpwardClamp() {
  const BodyMotion next =
      IntegrateBody(BodyMotion{300.0f, -20.0f}, false, kTuning);
  return NearlyEqual(next.velocity, -20.0f + cfg::kGravity) &&
         next.velocity < cfg::kImpulseVelocity;
}

bool TestImpulseOverridesVelocity() {
  const BodyMotion falling =
      IntegrateBody(BodyMotion{100.0f, 8.0f}, true, kTuning);
  const BodyMotion rising =
      IntegrateBody(BodyMotion{100.0f, -30.0f}, true, kTuning);
  return falling.velocity == cfg::kImpulseVelocity &&
         NearlyEqual(falling.y, 100.0f + cfg::kImpulseVelocity) &&
         rising.velocity == cfg::kImpulseVelocity;
}

bool TestVelocityNeverExceedsDropSpeed() {
  SimState state = MakeRunningState(7u);
  uint32_t script = 99u;
  for (int i = 0; i < 2000; ++i) {
    const bool activate = core::NextFloat01(script) < 0.05f;
    state = SimStep(state, activate, kTuning);
    if (state.bodyVelocity > cfg::kMaxDropSpeed) {
      return false;
    }
    if (state.phase == Phase::Over) {
      state = SimStep(state, true, kTuning);
    }
  }
  return true;
}

// --- Obstacle stream ---

bool TestSpawnCadence() {
  ObstacleList list{};
  int timer = 0;
  uint32_t rng = 5u;
  for (int i = 0; i < cfg::kSpawnSpacingTicks; ++i) {
    if (AdvanceObstacleStream(list, timer, rng, kTuning)) {
      return false;
    }
  }
  if (timer != cfg::kSpawnSpacingTicks || !list.empty()) {
    return false;
  }

  if (!AdvanceObstacleStream(list, timer, rng, kTuning)) {
    return false;
  }
  // Spawned one width past the right edge, then scrolled with the rest.
  const float expectedX = static_cast<float>(cfg::kFieldWidth) +
                          cfg::kObstacleWidth - cfg::kScrollSpeed;
  return timer == 0 && list.count == 1 &&
         NearlyEqual(list.items[0].x, expectedX, 1e-3f) &&
         !list.items[0].counted;
}

bool TestGapStaysInsidePlayfield() {
  uint32_t rng = 0xABCDEFu;
  const float minTop = cfg::kGapMargin;
  const float maxBottom =
      static_cast<float>(cfg::kFieldHeight) - cfg::kGroundHeight - cfg::kGapMargin;
  for (int i = 0; i < 5000; ++i) {
    ObstacleList list{};
    if (!SpawnObstacle(list, rng, kTuning)) {
      return false;
    }
    const float c = list.items[0].gapCenterY;
    if (c - cfg::kGapHeight * 0.5f < minTop - 1e-3f ||
        c + cfg::kGapHeight * 0.5f > maxBottom + 1e-3f) {
      return false;
    }
  }
  return true;
}

bool TestSpawnFailsWhenFull() {
  ObstacleList list{};
  uint32_t rng = 3u;
  for (int i = 0; i < cfg::kMaxObstacles; ++i) {
    if (!SpawnObstacle(list, rng, kTuning)) {
      return false;
    }
  }
  return !SpawnObstacle(list, rng, kTuning) &&
         list.count == cfg::kMaxObstacles;
}

bool TestCullPreservesOrder() {
  ObstacleList list{};
  Push(list, MakeObstacle(-120.0f, 200.0f)); // trailing edge -48: gone
  Push(list, MakeObstacle(-112.0f, 210.0f)); // trailing edge exactly -40: gone
  Push(list, MakeObstacle(-100.0f, 220.0f));
  Push(list, MakeObstacle(50.0f, 230.0f));
  Push(list, MakeObstacle(300.0f, 240.0f));

  CullObstacles(list, kTuning);

  return list.count == 3 && list.items[0].gapCenterY == 220.0f &&
         list.items[1].gapCenterY == 230.0f &&
         list.items[2].gapCenterY == 240.0f;
}

bool TestScrollKeepsOrdering() {
  SimState state = MakeRunningState(11u);
  Bot bot{};
  InitBot(bot, BotStyle::Tracker, 5u);
  for (int i = 0; i < 3000; ++i) {
    const SimState prev = state;
    state = SimStep(state, BotWantsActivate(bot, state, kTuning), kTuning);
    if (state.phase != Phase::Running) {
      return false;
    }
    for (int j = 1; j < state.obstacles.count; ++j) {
      if (!(state.obstacles.items[j - 1].x < state.obstacles.items[j].x)) {
        return false;
      }
    }
    // The front obstacle only ever moves left (or is culled).
    if (!prev.obstacles.empty() && !state.obstacles.empty() &&
        prev.obstacles.items[0].gapCenterY ==
            state.obstacles.items[0].gapCenterY &&
        !(state.obstacles.items[0].x < prev.obstacles.items[0].x)) {
      return false;
    }
  }
  return true;
}

// --- Collision & scoring ---

bool TestGroundTangentCollides() {
  const float groundLine = GroundLineY(kTuning);
  return CheckBoundaryCollision(groundLine - cfg::kBodyRadius, kTuning) ==
             EndCause::Ground &&
         CheckBoundaryCollision(groundLine - cfg::kBodyRadius - 1.0f,
                                kTuning) == EndCause::None;
}

bool TestCeilingTangentCollides() {
  return CheckBoundaryCollision(cfg::kBodyRadius, kTuning) ==
             EndCause::Ceiling &&
         CheckBoundaryCollision(cfg::kBodyRadius + 1.0f, kTuning) ==
             EndCause::None;
}

bool TestObstacleGapBounds() {
  // Body x = 120, radius 16; obstacle spans x 100..172, gap 210..390.
  const Obstacle o = MakeObstacle(100.0f, 300.0f);
  const bool inside = !CheckObstacleCollision(o, 300.0f, kTuning);
  const bool touchingTop = !CheckObstacleCollision(o, 226.0f, kTuning);
  const bool touchingBottom = !CheckObstacleCollision(o, 374.0f, kTuning);
  const bool hitsTop = CheckObstacleCollision(o, 220.0f, kTuning);
  const bool hitsBottom = CheckObstacleCollision(o, 380.0f, kTuning);
  return inside && touchingTop && touchingBottom && hitsTop && hitsBottom;
}

bool TestObstacleNeedsHorizontalOverlap() {
  // Leading edge exactly at the body's right edge: no overlap yet.
  const Obstacle ahead = MakeObstacle(136.0f, 300.0f);
  const Obstacle touching = MakeObstacle(135.0f, 300.0f);
  // Trailing edge exactly at the body's left edge: already clear.
  const Obstacle behind = MakeObstacle(104.0f - cfg::kObstacleWidth, 300.0f);
  return !CheckObstacleCollision(ahead, 100.0f, kTuning) &&
         CheckObstacleCollision(touching, 100.0f, kTuning) &&
         !CheckObstacleCollision(behind, 100.0f, kTuning);
}

bool TestScoringIsIdempotent() {
  ObstacleList list{};
  Push(list, MakeObstacle(BodyX(kTuning) - cfg::kObstacleWidth - 1.0f, 300.0f));

  const int first = ScorePassedObstacles(list, kTuning);
  const int second = ScorePassedObstacles(list, kTuning);
  return first == 1 && second == 0 && list.items[0].counted;
}

bool TestScoringVisitsWholeList() {
  ObstacleList list{};
  const float bodyX = BodyX(kTuning);
  Push(list, MakeObstacle(bodyX - cfg::kObstacleWidth - 30.0f, 250.0f));
  Push(list, MakeObstacle(bodyX - cfg::kObstacleWidth - 1.0f, 260.0f));
  // Trailing edge exactly at the body centre is not past it yet.
  Push(list, MakeObstacle(bodyX - cfg::kObstacleWidth, 270.0f));

  const int scored = ScorePassedObstacles(list, kTuning);
  return scored == 2 && list.items[0].counted && list.items[1].counted &&
         !list.items[2].counted;
}

bool TestScoreAndCollisionSameTick() {
  ObstacleList list{};
  Push(list, MakeObstacle(BodyX(kTuning) - cfg::kObstacleWidth - 1.0f, 300.0f));
  int score = 4;
  const DetectionResult result = DetectCollisions(
      list, GroundLineY(kTuning) - cfg::kBodyRadius, score, kTuning);
  return result.collided && result.cause == EndCause::Ground &&
         result.scored == 1 && score == 5 && list.items[0].counted;
}

bool TestScoringNotBlockedByEarlierHit() {
  ObstacleList list{};
  // Front obstacle overlaps the body and the body is outside its gap...
  Push(list, MakeObstacle(100.0f, 400.0f));
  // ...while a later (stale) entry has already been passed.
  Push(list, MakeObstacle(BodyX(kTuning) - cfg::kObstacleWidth - 5.0f, 300.0f));
  int score = 0;
  const DetectionResult result = DetectCollisions(list, 200.0f, score, kTuning);
  return result.collided && result.cause == EndCause::Obstacle &&
         result.scored == 1 && score == 1;
}

// --- Phase state machine ---

bool TestActivationTable() {
  const ActivationOutcome ready = ResolveActivation(Phase::Ready);
  const ActivationOutcome running = ResolveActivation(Phase::Running);
  const ActivationOutcome over = ResolveActivation(Phase::Over);
  return ready.next == Phase::Running && ready.resetRun && ready.applyImpulse &&
         running.next == Phase::Running && !running.resetRun &&
         running.applyImpulse && over.next == Phase::Running &&
         over.resetRun && !over.applyImpulse;
}

bool TestReadyAndOverHoldStill() {
  const SimState ready = MakeInitialState(9u, 0, kTuning);
  SimState idle = ready;
  for (int i = 0; i < 50; ++i) {
    idle = SimStep(idle, false, kTuning);
  }
  if (idle.phase != Phase::Ready || idle.bodyY != ready.bodyY ||
      idle.bodyVelocity != 0.0f || idle.frameCount != 0 ||
      idle.spawnTimer != 0) {
    return false;
  }

  const SimState over = RunUntilOver(MakeRunningState(), 1000);
  SimState frozen = over;
  for (int i = 0; i < 50; ++i) {
    frozen = SimStep(frozen, false, kTuning);
  }
  return over.phase == Phase::Over && frozen.phase == Phase::Over &&
         frozen.bodyY == over.bodyY &&
         frozen.bodyVelocity == over.bodyVelocity &&
         frozen.frameCount == over.frameCount && !frozen.events.collided;
}

bool TestRestartFromOverSkipsImpulse() {
  SimState state = RunUntilOver(MakeRunningState(), 1000);
  if (state.phase != Phase::Over) {
    return false;
  }
  state.score = 6;

  state = SimStep(state, true, kTuning);
  const bool reset = state.phase == Phase::Running &&
                     state.events.runRestarted && !state.events.runStarted &&
                     !state.events.impulseApplied && state.score == 0 &&
                     state.obstacles.empty() && state.frameCount == 1;
  // Physics ran once from rest with no impulse.
  const bool noFlap =
      NearlyEqual(state.bodyVelocity, cfg::kGravity) &&
      NearlyEqual(state.bodyY, cfg::kFieldHeight * 0.5f + cfg::kGravity);

  state = SimStep(state, true, kTuning);
  const bool secondFlaps = state.events.impulseApplied &&
                           state.bodyVelocity == cfg::kImpulseVelocity;
  return reset && noFlap && secondFlaps;
}

bool TestRunningActivationOnlyFlaps() {
  SimState state = MakeRunningState();
  for (int i = 0; i < 10; ++i) {
    state = SimStep(state, false, kTuning);
  }
  state.score = 2;
  const uint32_t frameBefore = state.frameCount;
  state = SimStep(state, true, kTuning);
  return state.phase == Phase::Running && state.score == 2 &&
         state.frameCount == frameBefore + 1 &&
         state.bodyVelocity == cfg::kImpulseVelocity &&
         !state.events.runStarted && !state.events.runRestarted;
}

bool TestBestScoreRaisedOnlyWhenBeaten() {
  SimState beat = MakeRunningState();
  beat.score = 5;
  beat.bestScore = 3;
  beat.bodyY = GroundLineY(kTuning) - cfg::kBodyRadius;
  beat = SimStep(beat, false, kTuning);

  SimState short_of = MakeRunningState();
  short_of.score = 2;
  short_of.bestScore = 3;
  short_of.bodyY = GroundLineY(kTuning) - cfg::kBodyRadius;
  short_of = SimStep(short_of, false, kTuning);

  SimState tie = MakeRunningState();
  tie.score = 3;
  tie.bestScore = 3;
  tie.bodyY = GroundLineY(kTuning) - cfg::kBodyRadius;
  tie = SimStep(tie, false, kTuning);

  return beat.phase == Phase::Over && beat.bestScore == 5 &&
         beat.events.newBestScore && short_of.phase == Phase::Over &&
         short_of.bestScore == 3 && !short_of.events.newBestScore &&
         tie.bestScore == 3 && !tie.events.newBestScore;
}

bool TestBestScoreSurvivesRestart() {
  SimState state = MakeRunningState();
  state.score = 9;
  state.bodyY = GroundLineY(kTuning) - cfg::kBodyRadius;
  state = SimStep(state, false, kTuning);
  state = SimStep(state, true, kTuning);
  return state.phase == Phase::Running && state.score == 0 &&
         state.bestScore == 9;
}

// --- Simulation step ---

bool TestStartFromReadyFlaps() {
  const SimState ready = MakeInitialState(42u, 0, kTuning);
  const SimState next = SimStep(ready, true, kTuning);
  return next.phase == Phase::Running &&
         next.bodyVelocity == cfg::kImpulseVelocity && next.score == 0 &&
         next.obstacles.empty() && next.events.runStarted &&
         next.events.impulseApplied && next.frameCount == 1 &&
         NearlyEqual(next.bodyY,
                     cfg::kFieldHeight * 0.5f + cfg::kImpulseVelocity);
}

bool TestUnflappedRunFallsToGround() {
  SimState state = MakeRunningState();
  SimState beforeEnd = state;
  int ticks = 0;
  for (; ticks < 1000 && state.phase == Phase::Running; ++ticks) {
    beforeEnd = state;
    state = SimStep(state, false, kTuning);
  }
  const float groundLine = GroundLineY(kTuning);
  return state.phase == Phase::Over && state.endCause == EndCause::Ground &&
         state.score == 0 && state.events.collided &&
         state.bodyY + cfg::kBodyRadius >= groundLine &&
         beforeEnd.bodyY + cfg::kBodyRadius < groundLine && ticks < 100;
}

bool TestPassedObstacleScoresOnce() {
  SimState state = MakeRunningState();
  state.score = 3;
  Push(state.obstacles, MakeObstacle(BodyX(kTuning) - cfg::kObstacleWidth - 1.0f,
                                     state.bodyY));
  state = SimStep(state, false, kTuning);
  return state.obstacles.count == 1 && state.obstacles.items[0].counted &&
         state.score == 4 && state.events.scored == 1 &&
         state.phase == Phase::Running;
}

bool TestCeilingTangentEndsRun() {
  // Velocity chosen so gravity brings it to exactly zero: the body stays
  // tangent to the ceiling through the tick.
  SimState resting = MakeRunningState();
  resting.bodyY = cfg::kBodyRadius;
  resting.bodyVelocity = -cfg::kGravity;
  resting = SimStep(resting, false, kTuning);

  SimState flapping = MakeRunningState();
  flapping.bodyY = cfg::kBodyRadius;
  flapping = SimStep(flapping, true, kTuning);

  return resting.phase == Phase::Over &&
         resting.endCause == EndCause::Ceiling &&
         flapping.phase == Phase::Over &&
         flapping.endCause == EndCause::Ceiling;
}

bool TestStepLeavesInputUntouched() {
  SimState before = MakeRunningState();
  Push(before.obstacles, MakeObstacle(200.0f, 300.0f));
  const SimState copy = before;
  const SimState after = SimStep(before, true, kTuning);
  return before.bodyY == copy.bodyY &&
         before.bodyVelocity == copy.bodyVelocity &&
         before.obstacles.items[0].x == copy.obstacles.items[0].x &&
         before.frameCount == copy.frameCount &&
         after.obstacles.items[0].x < before.obstacles.items[0].x;
}

bool TestDeterministicGapStream() {
  SimState a = MakeRunningState(0xBEEFu);
  SimState b = MakeRunningState(0xBEEFu);
  SimState c = MakeRunningState(0xF00Du);
  Bot botA{};
  Bot botB{};
  Bot botC{};
  InitBot(botA, BotStyle::Tracker, 1u);
  InitBot(botB, BotStyle::Tracker, 1u);
  InitBot(botC, BotStyle::Tracker, 1u);

  bool differs = false;
  for (int i = 0; i < 3000; ++i) {
    a = SimStep(a, BotWantsActivate(botA, a, kTuning), kTuning);
    b = SimStep(b, BotWantsActivate(botB, b, kTuning), kTuning);
    c = SimStep(c, BotWantsActivate(botC, c, kTuning), kTuning);

    if (a.obstacles.count != b.obstacles.count || a.bodyY != b.bodyY ||
        a.score != b.score || a.phase != b.phase) {
      return false;
    }
    for (int j = 0; j < a.obstacles.count; ++j) {
      if (a.obstacles.items[j].x != b.obstacles.items[j].x ||
          a.obstacles.items[j].gapCenterY != b.obstacles.items[j].gapCenterY) {
        return false;
      }
    }
    if (!a.obstacles.empty() && !c.obstacles.empty() &&
        a.obstacles.items[0].gapCenterY != c.obstacles.items[0].gapCenterY) {
      differs = true;
    }
  }
  return a.obstaclesSpawned > 5 && differs;
}

bool TestCountedNeverReverts() {
  SimState state = MakeRunningState(0x5EEDu);
  Bot bot{};
  InitBot(bot, BotStyle::Tracker, 77u);

  int countedEver = 0;
  for (int i = 0; i < 3000; ++i) {
    const SimState prev = state;
    state = SimStep(state, BotWantsActivate(bot, state, kTuning), kTuning);
    if (state.phase != Phase::Running || state.score < prev.score) {
      return false;
    }

    // Survivors of the cull line up with the front of the new list.
    int j = 0;
    int newlyCounted = 0;
    for (const auto &o : prev.obstacles) {
      if (o.x - cfg::kScrollSpeed + cfg::kObstacleWidth <= -cfg::kCullMargin) {
        continue;
      }
      const Obstacle &n = state.obstacles.items[j++];
      if (n.gapCenterY != o.gapCenterY || (o.counted && !n.counted)) {
        return false;
      }
      if (!o.counted && n.counted) {
        ++newlyCounted;
      }
    }
    if (newlyCounted != state.events.scored) {
      return false;
    }
    countedEver += newlyCounted;
    if (state.score != countedEver) {
      return false;
    }
  }
  return state.score >= 10;
}

bool TestTrackerBotSurvives() {
  SimState state = MakeInitialState(0xC0FFEEu, 0, kTuning);
  Bot bot{};
  InitBot(bot, BotStyle::Tracker, 0x12345678u);
  for (int i = 0; i < 3000; ++i) {
    state = SimStep(state, BotWantsActivate(bot, state, kTuning), kTuning);
  }
  return state.phase == Phase::Running && state.score >= 10;
}

bool TestIdleBobIsRenderOnly() {
  const SimState ready = MakeInitialState(1u, 0, kTuning);
  const float quarter = cfg::kIdleSwingPeriod * 3.14159265f * 0.5f;
  const bool bobs =
      NearlyEqual(DisplayBodyY(ready, 0.0), ready.bodyY) &&
      NearlyEqual(DisplayBodyY(ready, quarter),
                  ready.bodyY + cfg::kIdleSwingAmplitude, 1e-3f);

  SimState running = MakeRunningState();
  running = SimStep(running, false, kTuning);
  const bool runningExact = DisplayBodyY(running, quarter) == running.bodyY;

  const SimState still = SimStep(ready, false, kTuning);
  return bobs && runningExact && still.bodyY == ready.bodyY;
}

// --- Input coalescing and the frame driver ---

bool TestMailboxCoalesces() {
  ActivationMailbox box{};
  PostActivation(box);
  PostActivation(box);
  PostActivation(box);
  const bool first = TakeActivation(box);
  const bool second = TakeActivation(box);
  return first && !second && box.dropped == 2;
}

Game MakeHeadlessGame() {
  Game game{};
  game.tuning = kTuning;
  game.bestScorePath = "sim_tests_best_score_unused.txt";
  game.sim = MakeInitialState(42u, 0, kTuning);
  return game;
}

bool TestOneActivationPerTick() {
  Game game = MakeHeadlessGame();
  PostActivation(game.mailbox);
  PostActivation(game.mailbox);

  const int ticks = AdvanceFrame(game, cfg::kFixedDt * 3.5f);
  // Started (and flapped) on the first tick only; two gravity ticks followed.
  return ticks == 3 && game.simTicks == 3 && game.sim.phase == Phase::Running &&
         NearlyEqual(game.sim.bodyVelocity,
                     cfg::kImpulseVelocity + 2.0f * cfg::kGravity) &&
         !game.mailbox.pending;
}

bool TestFrameEventsCoverEveryTick() {
  Game game = MakeHeadlessGame();
  PostActivation(game.mailbox);

  const int ticks = AdvanceFrame(game, cfg::kFixedDt * 3.5f);
  // The start happened on the first of three ticks; the live snapshot only
  // reports the last one.
  const bool merged = ticks == 3 && game.frameEvents.runStarted &&
                      game.frameEvents.impulseApplied &&
                      !game.sim.events.runStarted &&
                      !game.sim.events.impulseApplied;

  // The half tick left over is not enough for another; nothing carries over.
  const int idleTicks = AdvanceFrame(game, cfg::kFixedDt * 0.25f);
  return merged && idleTicks == 0 && !game.frameEvents.runStarted &&
         !game.frameEvents.impulseApplied;
}

bool TestFrameBacklogIsCapped() {
  Game game = MakeHeadlessGame();
  const int ticks = AdvanceFrame(game, 1.0f);
  return ticks == cfg::kMaxTicksPerFrame && game.accumulator == 0.0f &&
         game.sim.phase == Phase::Ready;
}

// --- Logging ---

// Headless logging must not write to stdout (the runner prints JSON there) and
// must honour the starting level from the first line on.
bool TestConsoleLoggerKeepsStdoutClean() {
  const auto &logger = Log::GetLogger();
  if (logger->level() != spdlog::level::warn ||
      logger->should_log(spdlog::level::info) || logger->sinks().size() != 1) {
    return false;
  }
  const auto &sink = logger->sinks().front();
  return std::dynamic_pointer_cast<spdlog::sinks::stderr_color_sink_mt>(sink) !=
             nullptr &&
         std::dynamic_pointer_cast<spdlog::sinks::stdout_color_sink_mt>(sink) ==
             nullptr;
}

} // namespace

int main() {
  Log::Init(nullptr, spdlog::level::warn);
  int failed = 0;

  auto run = [&](const char *name, const bool ok) {
    if (!ok) {
      std::cerr << "[FAIL] " << name << '\n';
      ++failed;
    } else {
      std::cout << "[PASS] " << name << '\n';
    }
  };

  run("gravity_accumulates", TestGravityAccumulates());
  run("terminal_velocity_clamp", TestTerminalVelocityClamp());
  run("no_upward_clamp", TestNoUpwardClamp());
  run("impulse_overrides_velocity", TestImpulseOverridesVelocity());
  run("velocity_never_exceeds_drop_speed", TestVelocityNeverExceedsDropSpeed());
  run("spawn_cadence", TestSpawnCadence());
  run("gap_stays_inside_playfield", TestGapStaysInsidePlayfield());
  run("spawn_fails_when_full", TestSpawnFailsWhenFull());
  run("cull_preserves_order", TestCullPreservesOrder());
  run("scroll_keeps_ordering", TestScrollKeepsOrdering());
  run("ground_tangent_collides", TestGroundTangentCollides());
  run("ceiling_tangent_collides", TestCeilingTangentCollides());
  run("obstacle_gap_bounds", TestObstacleGapBounds());
  run("obstacle_needs_horizontal_overlap",
      TestObstacleNeedsHorizontalOverlap());
  run("scoring_is_idempotent", TestScoringIsIdempotent());
  run("scoring_visits_whole_list", TestScoringVisitsWholeList());
  run("score_and_collision_same_tick", TestScoreAndCollisionSameTick());
  run("scoring_not_blocked_by_earlier_hit", TestScoringNotBlockedByEarlierHit());
  run("activation_table", TestActivationTable());
  run("ready_and_over_hold_still", TestReadyAndOverHoldStill());
  run("restart_from_over_skips_impulse", TestRestartFromOverSkipsImpulse());
  run("running_activation_only_flaps", TestRunningActivationOnlyFlaps());
  run("best_score_raised_only_when_beaten",
      TestBestScoreRaisedOnlyWhenBeaten());
  run("best_score_survives_restart", TestBestScoreSurvivesRestart());
  run("start_from_ready_flaps", TestStartFromReadyFlaps());
  run("unflapped_run_falls_to_ground", TestUnflappedRunFallsToGround());
  run("passed_obstacle_scores_once", TestPassedObstacleScoresOnce());
  run("ceiling_tangent_ends_run", TestCeilingTangentEndsRun());
  run("step_leaves_input_untouched", TestStepLeavesInputUntouched());
  run("deterministic_gap_stream", TestDeterministicGapStream());
  run("counted_never_reverts", TestCountedNeverReverts());
  run("tracker_bot_survives", TestTrackerBotSurvives());
  run("idle_bob_is_render_only", TestIdleBobIsRenderOnly());
  run("mailbox_coalesces", TestMailboxCoalesces());
  run("one_activation_per_tick", TestOneActivationPerTick());
  run("frame_events_cover_every_tick", TestFrameEventsCoverEveryTick());
  run("frame_backlog_is_capped", TestFrameBacklogIsCapped());
  run("console_logger_keeps_stdout_clean", TestConsoleLoggerKeepsStdoutClean());

  Log::Shutdown();
  return (failed == 0) ? 0 : 1;
}
