#pragma once

#include <array>
#include <cstdint>

#include "core/Config.hpp"

enum class Phase {
  Ready,   // waiting for the first activation; nothing advances
  Running, // physics, obstacles and detection active
  Over,    // frozen at the point of collision
};

enum class EndCause {
  None,
  Ground,
  Ceiling,
  Obstacle,
};

// One gated obstacle. `x` is the leading (left) edge; the gap is centred on
// gapCenterY with the tuning's gap height. `counted` flips to true once, when
// the obstacle's trailing edge has passed the body, and never reverts.
struct Obstacle {
  float x = 0.0f;
  float gapCenterY = 0.0f;
  bool counted = false;
};

// Fixed-capacity, order-preserving list ordered by ascending x. Kept inline
// so copying a SimState never touches the heap.
struct ObstacleList {
  std::array<Obstacle, cfg::kMaxObstacles> items{};
  int count = 0;

  Obstacle *begin() { return items.data(); }
  Obstacle *end() { return items.data() + count; }
  const Obstacle *begin() const { return items.data(); }
  const Obstacle *end() const { return items.data() + count; }
  bool empty() const { return count == 0; }
};

// What happened during the tick that produced a snapshot. Cleared at the start
// of every step.
struct TickEvents {
  bool runStarted = false;   // Ready -> Running
  bool runRestarted = false; // Over -> Running
  bool impulseApplied = false;
  bool obstacleSpawned = false;
  int scored = 0;
  bool collided = false;
  bool newBestScore = false;
};

// The whole simulation. Replaced wholesale every tick; readers only ever see
// complete snapshots.
struct SimState {
  Phase phase = Phase::Ready;
  float bodyY = 0.0f;
  float bodyVelocity = 0.0f;
  ObstacleList obstacles{};
  uint32_t frameCount = 0; // ticks since the current run began
  int spawnTimer = 0;      // ticks since the last spawn
  int score = 0;

  int bestScore = 0; // carried across runs
  uint32_t rngState = 1u;
  uint32_t runSeed = 1u;
  uint32_t obstaclesSpawned = 0; // this run
  EndCause endCause = EndCause::None;

  TickEvents events{};
};
