#include "render/Render.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>

#include "core/Config.hpp"
#include "core/Log.hpp"
#include "game/Game.hpp"
#include "render/Palette.hpp"
#include "sim/Sim.hpp"

namespace {

constexpr float kPi = 3.14159265f;

// Sky gradient baked once; redrawing it every frame buys nothing.
RenderTexture2D s_SkyTexture{};
bool s_SkyReady = false;

float Clamp(const float value, const float minValue, const float maxValue) {
  if (value < minValue) return minValue;
  if (value > maxValue) return maxValue;
  return value;
}

// Rotates a body-local offset by `angle` radians and adds the centre.
Vector2 BodyPoint(const Vector2 centre, const float dx, const float dy,
                  const float angle) {
  const float c = std::cos(angle);
  const float s = std::sin(angle);
  return Vector2{centre.x + dx * c - dy * s, centre.y + dx * s + dy * c};
}

void DrawCenteredText(const char *text, const int centreX, const int y,
                      const int fontSize, const Color color,
                      const Color shade) {
  const int width = MeasureText(text, fontSize);
  DrawText(text, centreX - width / 2 + 2, y + 2, fontSize, shade);
  DrawText(text, centreX - width / 2, y, fontSize, color);
}

void DrawSky(const FieldPalette &pal, const Tuning &t) {
  if (!s_SkyReady) {
    DrawRectangleGradientV(0, 0, static_cast<int>(t.fieldWidth),
                           static_cast<int>(t.fieldHeight), pal.skyTop,
                           pal.skyBottom);
    return;
  }
  // Render textures are stored bottom-up; flip on the way out.
  const Texture2D &tex = s_SkyTexture.texture;
  DrawTextureRec(tex,
                 Rectangle{0.0f, 0.0f, static_cast<float>(tex.width),
                           -static_cast<float>(tex.height)},
                 Vector2{0.0f, 0.0f}, WHITE);
}

void DrawObstacles(const SimState &sim, const FieldPalette &pal,
                   const Tuning &t) {
  const float groundY = GroundLineY(t);
  const float lip = cfg::kObstacleLipHeight;
  const float overhang = cfg::kObstacleLipOverhang;
  for (const auto &o : sim.obstacles) {
    const float gapTop = o.gapCenterY - t.gapHeight * 0.5f;
    const float gapBottom = o.gapCenterY + t.gapHeight * 0.5f;

    // Upper column and its lip.
    DrawRectangleRec(Rectangle{o.x, 0.0f, t.obstacleWidth, gapTop},
                     pal.obstacle);
    DrawRectangleRec(Rectangle{o.x - overhang, gapTop - lip,
                               t.obstacleWidth + 2.0f * overhang, lip},
                     pal.obstacle);

    // Lower column down to the ground and its lip.
    DrawRectangleRec(
        Rectangle{o.x, gapBottom, t.obstacleWidth, groundY - gapBottom},
        pal.obstacle);
    DrawRectangleRec(Rectangle{o.x - overhang, gapBottom,
                               t.obstacleWidth + 2.0f * overhang, lip},
                     pal.obstacle);
  }
}

void DrawGround(const SimState &sim, const FieldPalette &pal,
                const Tuning &t) {
  const int width = static_cast<int>(t.fieldWidth);
  const int groundY = static_cast<int>(GroundLineY(t));
  DrawRectangle(0, groundY, width, static_cast<int>(t.groundHeight),
                pal.ground);

  const int offset =
      static_cast<int>((sim.frameCount * cfg::kGroundScrollPerFrame) %
                       static_cast<uint32_t>(std::max(width, 1)));
  const int stripes = width / cfg::kGroundStripeSpacing + 2;
  for (int i = -1; i < stripes; ++i) {
    const int x = (i * cfg::kGroundStripeSpacing + offset) % width;
    DrawRectangle(x, groundY, cfg::kGroundStripeWidth,
                  cfg::kGroundStripeHeight, pal.groundStripe);
  }
}

void DrawBody(const SimState &sim, const double timeSeconds,
              const FieldPalette &pal, const Tuning &t) {
  const float r = cfg::kBodyDrawRadius;
  const Vector2 centre{BodyX(t), DisplayBodyY(sim, timeSeconds)};
  const float tilt = Clamp(sim.bodyVelocity / t.maxDropSpeed, -1.0f, 1.0f);
  const float angle = tilt * cfg::kTiltMaxDeg * kPi / 180.0f;

  DrawCircleV(centre, r, pal.body);
  DrawCircleV(BodyPoint(centre, r * 0.4f, -r * 0.2f, angle), r * 0.3f,
              pal.bodyEye);
  const Vector2 beak = BodyPoint(centre, r, r * 0.1f, angle);
  DrawEllipse(static_cast<int>(beak.x), static_cast<int>(beak.y), r * 0.8f,
              r * 0.35f, pal.bodyBeak);
}

void DrawHud(const SimState &sim, const FieldPalette &pal, const Tuning &t) {
  const int centreX = static_cast<int>(t.fieldWidth * 0.5f);
  const int centreY = static_cast<int>(t.fieldHeight * 0.5f);
  char text[64];

  std::snprintf(text, sizeof(text), "%d", sim.score);
  DrawCenteredText(text, centreX, 52, 32, pal.uiText, pal.uiShade);

  std::snprintf(text, sizeof(text), "Best: %d",
                std::max(sim.bestScore, sim.score));
  DrawText(text, 24, 22, 16, pal.uiText);

  if (sim.phase == Phase::Ready) {
    DrawCenteredText("Tap or press Space to fly", centreX, centreY - 12, 24,
                     pal.uiText, pal.uiShade);
  } else if (sim.phase == Phase::Over) {
    DrawCenteredText("Game Over", centreX, centreY - 48, 32, pal.uiText,
                     pal.uiShade);
    DrawCenteredText("Tap or press Space to try again", centreX, centreY, 20,
                     pal.uiText, pal.uiShade);
  }
}

} // namespace

void InitRenderer(const Tuning &tuning) {
  const FieldPalette &pal = GetPalette();
  const int width = static_cast<int>(tuning.fieldWidth);
  const int height = static_cast<int>(tuning.fieldHeight);

  s_SkyTexture = LoadRenderTexture(width, height);
  s_SkyReady = (s_SkyTexture.id != 0);
  if (!s_SkyReady) {
    LOG_WARN("Sky texture unavailable, drawing the gradient per frame");
    return;
  }
  BeginTextureMode(s_SkyTexture);
  DrawRectangleGradientV(0, 0, width, height, pal.skyTop, pal.skyBottom);
  EndTextureMode();
  LOG_DEBUG("Renderer initialized ({}x{})", width, height);
}

void CleanupRenderer() {
  if (s_SkyReady) {
    UnloadRenderTexture(s_SkyTexture);
    s_SkyReady = false;
  }
}

void RenderFrame(const Game &game, const double timeSeconds) {
  const FieldPalette &pal = GetPalette();
  const Tuning &t = game.tuning;
  const SimState &sim = game.sim;

  BeginDrawing();
  ClearBackground(pal.skyBottom);
  DrawSky(pal, t);
  DrawObstacles(sim, pal, t);
  DrawGround(sim, pal, t);
  DrawBody(sim, timeSeconds, pal, t);
  DrawHud(sim, pal, t);
  EndDrawing();
}
