#include "sim/Collision.hpp"

EndCause CheckBoundaryCollision(const float bodyY, const Tuning &tuning) {
  if (bodyY + tuning.bodyRadius >= GroundLineY(tuning)) {
    return EndCause::Ground;
  }
  if (bodyY - tuning.bodyRadius <= 0.0f) {
    return EndCause::Ceiling;
  }
  return EndCause::None;
}

bool CheckObstacleCollision(const Obstacle &obstacle, const float bodyY,
                            const Tuning &tuning) {
  const float bodyX = BodyX(tuning);
  const float left = obstacle.x;
  const float right = obstacle.x + tuning.obstacleWidth;
  const bool overlapsX =
      bodyX + tuning.bodyRadius > left && bodyX - tuning.bodyRadius < right;
  if (!overlapsX) {
    return false;
  }

  const float gapTop = obstacle.gapCenterY - tuning.gapHeight * 0.5f;
  const float gapBottom = obstacle.gapCenterY + tuning.gapHeight * 0.5f;
  const float bodyTop = bodyY - tuning.bodyRadius;
  const float bodyBottom = bodyY + tuning.bodyRadius;
  return bodyTop < gapTop || bodyBottom > gapBottom;
}

int ScorePassedObstacles(ObstacleList &obstacles, const Tuning &tuning) {
  const float bodyX = BodyX(tuning);
  int scored = 0;
  for (auto &o : obstacles) {
    if (!o.counted && o.x + tuning.obstacleWidth < bodyX) {
      o.counted = true;
      ++scored;
    }
  }
  return scored;
}

DetectionResult DetectCollisions(ObstacleList &obstacles, const float bodyY,
                                 int &score, const Tuning &tuning) {
  DetectionResult result{};
  result.scored = ScorePassedObstacles(obstacles, tuning);
  score += result.scored;

  result.cause = CheckBoundaryCollision(bodyY, tuning);
  if (result.cause == EndCause::None) {
    for (const auto &o : obstacles) {
      if (CheckObstacleCollision(o, bodyY, tuning)) {
        result.cause = EndCause::Obstacle;
        break;
      }
    }
  }
  result.collided = (result.cause != EndCause::None);
  return result;
}
