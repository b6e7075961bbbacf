#pragma once

#include <string>

#include "core/Config.hpp"

// Every tunable the simulation reads. Defaults mirror cfg::; an optional JSON
// file may override them once at startup, after which the value is frozen.
struct Tuning {
  float fieldWidth = static_cast<float>(cfg::kFieldWidth);
  float fieldHeight = static_cast<float>(cfg::kFieldHeight);
  float groundHeight = cfg::kGroundHeight;
  float cullMargin = cfg::kCullMargin;

  float obstacleWidth = cfg::kObstacleWidth;
  float gapHeight = cfg::kGapHeight;
  float gapMargin = cfg::kGapMargin;
  int spawnSpacingTicks = cfg::kSpawnSpacingTicks;
  float scrollSpeed = cfg::kScrollSpeed;

  float bodyXFraction = cfg::kBodyXFraction;
  float bodyRadius = cfg::kBodyRadius;
  float gravity = cfg::kGravity;
  float impulseVelocity = cfg::kImpulseVelocity;
  float maxDropSpeed = cfg::kMaxDropSpeed;
};

// y of the ground line; the body dies when its lower edge reaches it.
inline float GroundLineY(const Tuning &t) {
  return t.fieldHeight - t.groundHeight;
}

// Fixed horizontal position of the body's centre.
inline float BodyX(const Tuning &t) { return t.fieldWidth * t.bodyXFraction; }

// Range of gap centres that keeps the whole gap between the two margins.
inline float GapCenterMin(const Tuning &t) {
  return t.gapMargin + t.gapHeight * 0.5f;
}
inline float GapCenterMax(const Tuning &t) {
  return GroundLineY(t) - t.gapMargin - t.gapHeight * 0.5f;
}

// Upper bound on how many obstacles can be alive at once.
int MaxConcurrentObstacles(const Tuning &t);

// Returns false and fills `reason` when the tuning cannot produce a playable
// game. Intended to run once at startup.
bool ValidateTuning(const Tuning &t, std::string &reason);

// Overlays values from a JSON file onto `t`. A missing file keeps `t` as-is
// and returns true; a malformed one logs and returns false.
bool LoadTuningFromFile(Tuning &t, const char *path);
