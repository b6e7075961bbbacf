#include "sim/ObstacleStream.hpp"

#include "core/Log.hpp"
#include "core/Rng.hpp"

void ScrollObstacles(ObstacleList &obstacles, const float speed) {
  for (auto &o : obstacles) {
    o.x -= speed;
  }
}

void CullObstacles(ObstacleList &obstacles, const Tuning &tuning) {
  int writeIdx = 0;
  for (int i = 0; i < obstacles.count; ++i) {
    const Obstacle &o = obstacles.items[i];
    if (o.x + tuning.obstacleWidth > -tuning.cullMargin) {
      if (writeIdx != i) {
        obstacles.items[writeIdx] = o;
      }
      ++writeIdx;
    }
  }
  obstacles.count = writeIdx;
}

bool SpawnObstacle(ObstacleList &obstacles, uint32_t &rngState,
                   const Tuning &tuning) {
  if (obstacles.count >= cfg::kMaxObstacles) {
    LOG_WARN("Obstacle list full ({}), skipping spawn", cfg::kMaxObstacles);
    return false;
  }
  Obstacle &o = obstacles.items[obstacles.count++];
  o.x = tuning.fieldWidth + tuning.obstacleWidth;
  o.gapCenterY =
      core::NextRange(rngState, GapCenterMin(tuning), GapCenterMax(tuning));
  o.counted = false;
  return true;
}

bool AdvanceObstacleStream(ObstacleList &obstacles, int &spawnTimer,
                           uint32_t &rngState, const Tuning &tuning) {
  bool spawned = false;
  if (spawnTimer + 1 > tuning.spawnSpacingTicks) {
    spawned = SpawnObstacle(obstacles, rngState, tuning);
    spawnTimer = 0;
  } else {
    ++spawnTimer;
  }

  ScrollObstacles(obstacles, tuning.scrollSpeed);
  CullObstacles(obstacles, tuning);
  return spawned;
}
