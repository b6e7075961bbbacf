#include "core/Tuning.hpp"

#include <climits>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <system_error>
#include <nlohmann/json.hpp>

#include "core/Log.hpp"

using json = nlohmann::json;

namespace {

constexpr const char *kKnownKeys[] = {
    "fieldWidth",    "fieldHeight",       "groundHeight", "cullMargin",
    "obstacleWidth", "gapHeight",         "gapMargin",    "spawnSpacingTicks",
    "scrollSpeed",   "bodyXFraction",     "bodyRadius",   "gravity",
    "impulseVelocity", "maxDropSpeed",
};

bool IsKnownKey(const std::string &key) {
  for (const char *known : kKnownKeys) {
    if (key == known)
      return true;
  }
  return false;
}

bool IsPositive(const float value) {
  return std::isfinite(value) && value > 0.0f;
}

} // namespace

int MaxConcurrentObstacles(const Tuning &t) {
  // An obstacle spawns at fieldWidth + width and is culled once its trailing
  // edge is past -cullMargin.
  const float travel = t.fieldWidth + 2.0f * t.obstacleWidth + t.cullMargin;
  const double lifetimeTicks =
      std::ceil(static_cast<double>(travel / t.scrollSpeed));
  const double ticksBetweenSpawns =
      static_cast<double>(t.spawnSpacingTicks) + 1.0;
  const double bound = std::floor(lifetimeTicks / ticksBetweenSpawns) + 1.0;
  // Near-zero scroll speeds or spacings make the bound unrepresentable.
  if (!std::isfinite(bound) || bound >= static_cast<double>(INT_MAX)) {
    return INT_MAX;
  }
  return static_cast<int>(bound);
}

bool ValidateTuning(const Tuning &t, std::string &reason) {
  if (!IsPositive(t.fieldWidth) || !IsPositive(t.fieldHeight)) {
    reason = "field dimensions must be positive";
    return false;
  }
  if (!IsPositive(t.groundHeight) || t.groundHeight >= t.fieldHeight) {
    reason = "ground height must be positive and below the field height";
    return false;
  }
  if (!std::isfinite(t.cullMargin) || t.cullMargin < 0.0f) {
    reason = "cull margin must not be negative";
    return false;
  }
  if (!IsPositive(t.obstacleWidth) || !IsPositive(t.gapHeight)) {
    reason = "obstacle width and gap height must be positive";
    return false;
  }
  if (t.gapHeight >= GroundLineY(t)) {
    reason = "gap height must be smaller than the playfield height";
    return false;
  }
  if (!std::isfinite(t.gapMargin) || t.gapMargin < 0.0f) {
    reason = "gap margin must not be negative";
    return false;
  }
  if (GapCenterMax(t) < GapCenterMin(t)) {
    reason = "gap plus margins do not fit in the playfield";
    return false;
  }
  if (t.spawnSpacingTicks < 0) {
    reason = "spawn spacing must not be negative";
    return false;
  }
  if (!IsPositive(t.scrollSpeed)) {
    reason = "scroll speed must be positive";
    return false;
  }
  if (!std::isfinite(t.bodyXFraction) || t.bodyXFraction <= 0.0f ||
      t.bodyXFraction >= 1.0f) {
    reason = "body x fraction must lie inside (0, 1)";
    return false;
  }
  if (!IsPositive(t.bodyRadius) || 2.0f * t.bodyRadius >= t.gapHeight) {
    reason = "body must fit through the gap";
    return false;
  }
  if (!IsPositive(t.gravity) || !IsPositive(t.maxDropSpeed)) {
    reason = "gravity and terminal fall speed must be positive";
    return false;
  }
  if (!std::isfinite(t.impulseVelocity) || t.impulseVelocity >= 0.0f) {
    reason = "impulse velocity must be negative (upward)";
    return false;
  }
  if (MaxConcurrentObstacles(t) > cfg::kMaxObstacles) {
    reason = "spawn spacing too tight for the obstacle capacity";
    return false;
  }
  reason.clear();
  return true;
}

bool LoadTuningFromFile(Tuning &t, const char *path) {
  std::error_code ec;
  const bool present = std::filesystem::exists(path, ec);
  if (ec) {
    LOG_ERROR("Cannot access tuning file {}: {}", path, ec.message());
    return false;
  }
  if (!present) {
    LOG_INFO("No tuning file at {}, using defaults", path);
    return true;
  }

  std::ifstream f(path);
  if (!f.is_open()) {
    LOG_ERROR("Failed to open tuning file: {}", path);
    return false;
  }

  try {
    const json data = json::parse(f);
    if (!data.is_object()) {
      LOG_ERROR("Tuning file {} must hold a JSON object", path);
      return false;
    }

    for (const auto &item : data.items()) {
      if (!IsKnownKey(item.key())) {
        LOG_WARN("Ignoring unknown tuning key '{}'", item.key());
      }
    }

    Tuning loaded = t;
    loaded.fieldWidth = data.value("fieldWidth", t.fieldWidth);
    loaded.fieldHeight = data.value("fieldHeight", t.fieldHeight);
    loaded.groundHeight = data.value("groundHeight", t.groundHeight);
    loaded.cullMargin = data.value("cullMargin", t.cullMargin);
    loaded.obstacleWidth = data.value("obstacleWidth", t.obstacleWidth);
    loaded.gapHeight = data.value("gapHeight", t.gapHeight);
    loaded.gapMargin = data.value("gapMargin", t.gapMargin);
    loaded.spawnSpacingTicks =
        data.value("spawnSpacingTicks", t.spawnSpacingTicks);
    loaded.scrollSpeed = data.value("scrollSpeed", t.scrollSpeed);
    loaded.bodyXFraction = data.value("bodyXFraction", t.bodyXFraction);
    loaded.bodyRadius = data.value("bodyRadius", t.bodyRadius);
    loaded.gravity = data.value("gravity", t.gravity);
    loaded.impulseVelocity = data.value("impulseVelocity", t.impulseVelocity);
    loaded.maxDropSpeed = data.value("maxDropSpeed", t.maxDropSpeed);

    t = loaded;
    LOG_INFO("Loaded tuning overrides from {}", path);
    return true;
  } catch (const json::exception &e) {
    LOG_ERROR("JSON error in tuning file {}: {}", path, e.what());
    return false;
  }
}
