#include <chrono>
#include <ctime>
#include <string>

#include <raylib.h>

#include "core/Assets.hpp"
#include "core/Config.hpp"
#include "core/CrashHandler.hpp"
#include "core/Log.hpp"
#include "core/PerfTracker.hpp"
#include "core/Tuning.hpp"
#include "game/Game.hpp"
#include "render/Render.hpp"

int main() {
  Log::Init();
  CrashHandler::Init();
  LOG_INFO("FlapGate starting...");

  Tuning tuning{};
  const std::string tuningPath = assets::Path(cfg::kTuningFile);
  if (!LoadTuningFromFile(tuning, tuningPath.c_str())) {
    LOG_CRITICAL("Could not load tuning from {}", tuningPath);
    Log::Shutdown();
    return 1;
  }
  std::string reason;
  if (!ValidateTuning(tuning, reason)) {
    LOG_CRITICAL("Invalid tuning: {}", reason);
    Log::Shutdown();
    return 1;
  }

  SetConfigFlags(FLAG_MSAA_4X_HINT | FLAG_VSYNC_HINT);
  InitWindow(static_cast<int>(tuning.fieldWidth),
             static_cast<int>(tuning.fieldHeight), "FlapGate");
  SetExitKey(0); // Escape is read through cfg::keys like every other key.
  SetTargetFPS(60);

  Game game{};
  InitGame(game, static_cast<uint32_t>(std::time(nullptr)), tuning);
  InitRenderer(game.tuning);

  using Clock = std::chrono::steady_clock;

  while (!WindowShouldClose() && !game.wantsExit) {
    ReadInput(game);

    // --- Measure Update (fixed sim ticks) ---
    perf::ResetAllocCounter();
    const auto updateStart = Clock::now();
    AdvanceFrame(game, GetFrameTime());
    const auto updateEnd = Clock::now();
    game.updateMs =
        std::chrono::duration<float, std::milli>(updateEnd - updateStart)
            .count();
    game.updateAllocCount = perf::ReadAllocCounter();

#ifndef NDEBUG
    if (game.updateMs > 2.0f) {
      LOG_WARN("Update took {:.3f} ms (> 2ms budget)", game.updateMs);
    }
    // Phase transitions log and may save the best score; plain ticks must not
    // allocate. Any tick of the frame may have been the transition.
    const TickEvents &ev = game.frameEvents;
    const bool transition = ev.runStarted || ev.runRestarted || ev.collided;
    if (game.updateAllocCount > 0 && !transition) {
      LOG_WARN("{} heap allocation(s) ({} bytes) during update",
               game.updateAllocCount, perf::ReadAllocBytes());
    }
#endif

    // --- Measure Render ---
    const auto renderStart = Clock::now();
    RenderFrame(game, GetTime());
    const auto renderEnd = Clock::now();
    game.renderMs =
        std::chrono::duration<float, std::milli>(renderEnd - renderStart)
            .count();
  }

  LOG_INFO("FlapGate shutting down after {} ticks (best score {})",
           game.simTicks, game.sim.bestScore);
  CleanupRenderer();
  CloseWindow();
  Log::Shutdown();
  return 0;
}
