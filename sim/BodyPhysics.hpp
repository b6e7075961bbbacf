#pragma once

#include "core/Tuning.hpp"

struct BodyMotion {
  float y = 0.0f;
  float velocity = 0.0f;
};

// One semi-implicit Euler step: gravity (clamped on the downward side only),
// then an optional impulse that overrides the velocity, then position.
// Does not look at boundaries.
BodyMotion IntegrateBody(const BodyMotion &body, bool impulse,
                         const Tuning &tuning);
