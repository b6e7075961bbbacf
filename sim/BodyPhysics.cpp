#include "sim/BodyPhysics.hpp"

#include <algorithm>

BodyMotion IntegrateBody(const BodyMotion &body, const bool impulse,
                         const Tuning &tuning) {
  BodyMotion next{};
  next.velocity = std::min(body.velocity + tuning.gravity, tuning.maxDropSpeed);
  if (impulse) {
    next.velocity = tuning.impulseVelocity;
  }
  next.y = body.y + next.velocity;
  return next;
}
