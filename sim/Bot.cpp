#include "sim/Bot.hpp"

#include "core/Rng.hpp"

namespace {

constexpr int kMinTicksBetweenFlaps = 8;
constexpr float kTrackerSlack = 10.0f;     // px below target before flapping
constexpr float kRandomFlapChance = 0.06f;

// Gap centre of the first obstacle the body has not fully cleared, or the
// middle of the spawn range when none is in play.
float NextGapCenter(const SimState& state, const Tuning& tuning) {
    const float bodyLeft = BodyX(tuning) - tuning.bodyRadius;
    for (const auto& o : state.obstacles) {
        if (o.x + tuning.obstacleWidth >= bodyLeft) {
            return o.gapCenterY;
        }
    }
    return 0.5f * (GapCenterMin(tuning) + GapCenterMax(tuning));
}

}  // namespace

void InitBot(Bot& bot, const BotStyle style, const uint32_t seed) {
    bot.style = style;
    bot.rng = core::NormalizeSeed(seed);
    bot.ticksSinceFlap = 0;
}

bool BotWantsActivate(Bot& bot, const SimState& state, const Tuning& tuning) {
    if (state.phase == Phase::Ready) {
        bot.ticksSinceFlap = 0;
        return true;
    }
    if (state.phase != Phase::Running) {
        return false;
    }

    ++bot.ticksSinceFlap;
    if (bot.ticksSinceFlap < kMinTicksBetweenFlaps) {
        return false;
    }

    bool flap = false;
    switch (bot.style) {
        case BotStyle::Tracker: {
            const float target = NextGapCenter(state, tuning);
            flap = state.bodyVelocity >= 0.0f &&
                   state.bodyY > target + kTrackerSlack;
            break;
        }
        case BotStyle::Random:
            flap = core::NextFloat01(bot.rng) < kRandomFlapChance;
            break;
        case BotStyle::Idle:
            break;
    }

    if (flap) {
        bot.ticksSinceFlap = 0;
    }
    return flap;
}

const char* BotStyleName(const BotStyle style) {
    switch (style) {
        case BotStyle::Tracker: return "tracker";
        case BotStyle::Random:  return "random";
        case BotStyle::Idle:    return "idle";
    }
    return "unknown";
}
