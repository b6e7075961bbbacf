#pragma once

#include <cstdint>

#include "core/Tuning.hpp"
#include "sim/SimState.hpp"

// Bot behavior presets.
enum class BotStyle {
    Tracker,  // flaps to hold the body just above the next gap centre
    Random,   // seeded random flaps for stress testing
    Idle,     // starts the run, then never flaps
};

// Deterministic autopilot that decides whether to activate this tick.
// Uses its own RNG state so it never perturbs the snapshot's gap stream.
struct Bot {
    BotStyle style = BotStyle::Tracker;
    uint32_t rng = 1u;
    int ticksSinceFlap = 0;
};

void InitBot(Bot& bot, BotStyle style, uint32_t seed);

// True when the bot wants an activation for the upcoming tick.
bool BotWantsActivate(Bot& bot, const SimState& state, const Tuning& tuning);

const char* BotStyleName(BotStyle style);
