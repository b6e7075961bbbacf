#pragma once

namespace cfg {
// --- Window / frame driver ---
constexpr int kFieldWidth = 480;
constexpr int kFieldHeight = 640;

constexpr float kFixedDt = 1.0f / 60.0f; // one sim tick
constexpr float kMaxFrameTime = 0.25f;
constexpr int kMaxTicksPerFrame = 4;

// --- Playfield ---
constexpr float kGroundHeight = 100.0f; // ground band at the bottom
constexpr float kCullMargin = 40.0f;    // obstacles die past x = -margin

// --- Obstacles ---
constexpr int kMaxObstacles = 16; // fixed capacity of a snapshot
constexpr float kObstacleWidth = 72.0f;
constexpr float kGapHeight = 180.0f;
constexpr float kGapMargin = 80.0f; // kept free above and below every gap
constexpr int kSpawnSpacingTicks = 220;
constexpr float kScrollSpeed = 2.6f; // px per tick

// --- Body ---
constexpr float kBodyXFraction = 0.25f; // body x = field width * fraction
constexpr float kBodyRadius = 16.0f;    // collision radius
constexpr float kBodyDrawRadius = 18.0f;
constexpr float kGravity = 0.45f;        // px per tick^2
constexpr float kImpulseVelocity = -7.5f; // px per tick, negative is up
constexpr float kMaxDropSpeed = 10.0f;

// --- Render-only ---
constexpr float kIdleSwingAmplitude = 6.0f;
constexpr float kIdleSwingPeriod = 0.3f; // seconds per radian
constexpr float kTiltMaxDeg = 30.0f;
constexpr float kObstacleLipHeight = 24.0f;
constexpr float kObstacleLipOverhang = 6.0f;
constexpr int kGroundStripeSpacing = 40;
constexpr int kGroundStripeWidth = 20;
constexpr int kGroundStripeHeight = 10;
constexpr int kGroundScrollPerFrame = 2;

// --- Storage ---
constexpr const char *kBestScoreFile = "best_score.txt";
constexpr const char *kTuningFile = "tuning.json"; // under assets/

// --- Controls ---
struct KeyConfig {
  int flap = 32;    // KEY_SPACE
  int flapAlt = 265; // KEY_UP
  int quit = 256;   // KEY_ESCAPE
  int mouseFlap = 0; // MOUSE_BUTTON_LEFT
};

extern KeyConfig keys;

} // namespace cfg
