#pragma once

#include <cstdint>

#include "core/Tuning.hpp"
#include "sim/SimState.hpp"

// Moves every obstacle left by `speed`.
void ScrollObstacles(ObstacleList &obstacles, float speed);

// Drops obstacles whose trailing edge is at or past -cullMargin. Order of the
// survivors is preserved.
void CullObstacles(ObstacleList &obstacles, const Tuning &tuning);

// Appends one obstacle just beyond the right edge with a random gap centre.
// Returns false if the list is full.
bool SpawnObstacle(ObstacleList &obstacles, uint32_t &rngState,
                   const Tuning &tuning);

// One tick of the stream: spawn when the timer runs past the spacing (else
// count up), then scroll and cull. Returns true if an obstacle spawned.
bool AdvanceObstacleStream(ObstacleList &obstacles, int &spawnTimer,
                           uint32_t &rngState, const Tuning &tuning);
