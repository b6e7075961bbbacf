// sim_runner: headless run of the simulation driven by a deterministic bot
//
// Runs the fixed-tick simulation without a window and prints a summary.
// Useful for tuning checks and regression testing of the gap stream.
//
// Usage:
//   sim_runner [options]
//     --seed <hex|dec>     Gap stream seed (default: 0xC0FFEE)
//     --ticks <n>          Max sim ticks to run (default: 36000 = 10 min at 60Hz)
//     --bot <style>        Bot style: tracker|random|idle (default: tracker)
//     --tuning <path>      JSON tuning overrides (default: built-in constants)
//     --json               Output as JSON instead of plain text
//     --quiet              Only output final summary line
//     -h, --help           Print usage

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>

#include "core/Log.hpp"
#include "core/Tuning.hpp"
#include "sim/Bot.hpp"
#include "sim/PhaseMachine.hpp"
#include "sim/Sim.hpp"

namespace {

struct RunnerArgs {
    uint32_t seed = 0xC0FFEEu;
    int maxTicks = 36000;          // 10 minutes at 60 Hz
    BotStyle botStyle = BotStyle::Tracker;
    std::string tuningPath;        // empty = defaults only
    bool json = false;
    bool quiet = false;
    bool help = false;
};

uint32_t ParseSeed(const char* str) {
    // Accept 0x prefix for hex, otherwise decimal.
    return static_cast<uint32_t>(std::strtoul(str, nullptr, 0));
}

BotStyle ParseBotStyle(const char* str) {
    if (std::strcmp(str, "random") == 0) return BotStyle::Random;
    if (std::strcmp(str, "idle") == 0) return BotStyle::Idle;
    return BotStyle::Tracker;
}

RunnerArgs ParseArgs(int argc, char* argv[]) {
    RunnerArgs args{};
    for (int i = 1; i < argc; ++i) {
        if ((std::strcmp(argv[i], "--seed") == 0) && i + 1 < argc) {
            args.seed = ParseSeed(argv[++i]);
        } else if ((std::strcmp(argv[i], "--ticks") == 0) && i + 1 < argc) {
            args.maxTicks = std::atoi(argv[++i]);
            if (args.maxTicks < 1) args.maxTicks = 1;
        } else if ((std::strcmp(argv[i], "--bot") == 0) && i + 1 < argc) {
            args.botStyle = ParseBotStyle(argv[++i]);
        } else if ((std::strcmp(argv[i], "--tuning") == 0) && i + 1 < argc) {
            args.tuningPath = argv[++i];
        } else if (std::strcmp(argv[i], "--json") == 0) {
            args.json = true;
        } else if (std::strcmp(argv[i], "--quiet") == 0) {
            args.quiet = true;
        } else if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            args.help = true;
        }
    }
    return args;
}

void PrintUsage() {
    std::printf(
        "sim_runner: headless FlapGate run driven by a deterministic bot\n"
        "\n"
        "Usage: sim_runner [options]\n"
        "  --seed <hex|dec>     Gap stream seed (default: 0xC0FFEE)\n"
        "  --ticks <n>          Max sim ticks (default: 36000 = 10 min)\n"
        "  --bot <style>        tracker|random|idle (default: tracker)\n"
        "  --tuning <path>      JSON tuning overrides\n"
        "  --json               Output as JSON\n"
        "  --quiet              Only final summary line\n"
        "  -h, --help           This message\n"
    );
}

}  // namespace

int main(int argc, char* argv[]) {
    const RunnerArgs args = ParseArgs(argc, argv);
    if (args.help) {
        PrintUsage();
        return 0;
    }

    Log::Init(nullptr, (args.quiet || args.json) ? spdlog::level::warn
                                                 : spdlog::level::info);

    Tuning tuning{};
    if (!args.tuningPath.empty() &&
        !LoadTuningFromFile(tuning, args.tuningPath.c_str())) {
        LOG_CRITICAL("Could not load tuning from {}", args.tuningPath);
        return 2;
    }
    std::string reason;
    if (!ValidateTuning(tuning, reason)) {
        LOG_CRITICAL("Invalid tuning: {}", reason);
        return 2;
    }

    SimState sim = MakeInitialState(args.seed, 0, tuning);
    Bot bot{};
    InitBot(bot, args.botStyle, args.seed ^ 0x12345678u);

    using Clock = std::chrono::steady_clock;
    const auto wallStart = Clock::now();

    int ticksRun = 0;
    int flaps = 0;
    for (int t = 0; t < args.maxTicks; ++t) {
        const bool activate = BotWantsActivate(bot, sim, tuning);
        sim = SimStep(sim, activate, tuning);
        ++ticksRun;
        if (sim.events.impulseApplied) ++flaps;
        if (sim.phase == Phase::Over) break;
    }

    const auto wallEnd = Clock::now();
    const float wallMs = std::chrono::duration<float, std::milli>(wallEnd - wallStart).count();
    const float perfMsPer1k = (ticksRun > 0) ? (wallMs / (static_cast<float>(ticksRun) / 1000.0f)) : 0.0f;
    const bool survived = sim.phase != Phase::Over;

    if (args.json) {
        std::printf("{\n");
        std::printf("  \"seed\": \"0x%08X\",\n", args.seed);
        std::printf("  \"bot\": \"%s\",\n", BotStyleName(args.botStyle));
        std::printf("  \"ticks_run\": %d,\n", ticksRun);
        std::printf("  \"ticks_max\": %d,\n", args.maxTicks);
        std::printf("  \"score\": %d,\n", sim.score);
        std::printf("  \"obstacles_spawned\": %u,\n", sim.obstaclesSpawned);
        std::printf("  \"flaps\": %d,\n", flaps);
        std::printf("  \"status\": \"%s\",\n", survived ? "SURVIVED" : "DIED");
        std::printf("  \"death_cause\": \"%s\",\n", EndCauseName(sim.endCause));
        std::printf("  \"body_y\": %.2f,\n", sim.bodyY);
        std::printf("  \"wall_ms\": %.2f,\n", wallMs);
        std::printf("  \"perf_ms_per_1k\": %.3f\n", perfMsPer1k);
        std::printf("}\n");
    } else if (args.quiet) {
        std::printf("seed=0x%08X  status=%-8s  score=%-6d  ticks=%-7d  cause=%-8s  perf=%.3fms/1k\n",
                    args.seed,
                    survived ? "SURVIVED" : "DIED",
                    sim.score, ticksRun, EndCauseName(sim.endCause), perfMsPer1k);
    } else {
        std::printf("=== FlapGate Headless Sim Runner ===\n");
        std::printf("seed:       0x%08X\n", args.seed);
        std::printf("bot:        %s\n", BotStyleName(args.botStyle));
        std::printf("ticks:      %d / %d\n", ticksRun, args.maxTicks);
        std::printf("score:      %d\n", sim.score);
        std::printf("spawned:    %u\n", sim.obstaclesSpawned);
        std::printf("flaps:      %d\n", flaps);
        std::printf("status:     %s\n", survived ? "SURVIVED" : "DIED");
        if (!survived) {
            std::printf("death:      %s at y=%.2f\n", EndCauseName(sim.endCause), sim.bodyY);
        }
        std::printf("wall_time:  %.2f ms\n", wallMs);
        std::printf("perf:       %.3f ms / 1000 ticks\n", perfMsPer1k);
    }

    Log::Shutdown();
    return survived ? 0 : 1;
}
