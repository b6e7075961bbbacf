#pragma once

#include <cstdint>
#include <string>

#include "core/Config.hpp"
#include "core/Tuning.hpp"
#include "sim/Mailbox.hpp"
#include "sim/SimState.hpp"

// Everything the frame driver owns. `sim` is the single live snapshot: only
// TickGame writes it, by replacing it whole.
struct Game {
    SimState sim{};
    Tuning tuning{};
    ActivationMailbox mailbox{};

    std::string bestScorePath = cfg::kBestScoreFile;
    bool wantsExit = false;

    float accumulator = 0.0f;
    uint64_t simTicks = 0;
    TickEvents frameEvents{}; // merged over the ticks of the last frame

    float updateMs = 0.0f;
    float renderMs = 0.0f;
    int   updateAllocCount = 0;
};

// Loads the best score and puts a Ready snapshot in place.
void InitGame(Game& game, uint32_t seed, const Tuning& tuning);

// Polls keyboard and pointer and posts activations. Needs a raylib window.
void ReadInput(Game& game);

// One fixed tick: consumes at most one activation, replaces the snapshot,
// persists a new best score.
void TickGame(Game& game);

// Feeds `frameTime` into the accumulator and runs the fixed ticks it covers.
// Returns the number of ticks run; their events are merged into frameEvents.
int AdvanceFrame(Game& game, float frameTime);

// Best-score store. Load never fails outward: any problem yields 0 and a
// warning. Save returns false (and warns) when the value could not be written.
int LoadBestScore(const char* path);
bool SaveBestScore(const char* path, int value);
