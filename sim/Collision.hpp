#pragma once

#include "core/Tuning.hpp"
#include "sim/SimState.hpp"

struct DetectionResult {
  bool collided = false;
  EndCause cause = EndCause::None;
  int scored = 0;
};

// Ground when the lower edge is at or below the ground line, ceiling when the
// upper edge is at or above y = 0. Tangent contact counts.
EndCause CheckBoundaryCollision(float bodyY, const Tuning &tuning);

// True when the body overlaps the obstacle horizontally and pokes out of its
// gap vertically.
bool CheckObstacleCollision(const Obstacle &obstacle, float bodyY,
                            const Tuning &tuning);

// Marks every uncounted obstacle whose trailing edge is left of the body's
// centre, front to back. Returns how many were newly counted.
int ScorePassedObstacles(ObstacleList &obstacles, const Tuning &tuning);

// Scoring first, then boundaries, then obstacles. Scoring always visits the
// whole list, so a point and a terminal hit can land in the same tick.
DetectionResult DetectCollisions(ObstacleList &obstacles, float bodyY,
                                 int &score, const Tuning &tuning);
