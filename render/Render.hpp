#pragma once

struct Game;
struct Tuning;

// Needs an open window.
void InitRenderer(const Tuning& tuning);
void CleanupRenderer();
// Draws one frame from the current snapshot. Never writes to `game`.
void RenderFrame(const Game& game, double timeSeconds);
