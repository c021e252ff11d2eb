/**
 * @file main.cpp
 * @brief Console harness for the CTK engine.
 *
 * Loads an optional launcher preset, solves for the target, fires, and prints
 * the result. Intended as a stand-in for an interactive front end.
 *
 * Usage:
 *   ctk_cli [--preset FILE] [--target M] [--wind MS] [--angle DEG]
 *           [--seed N] [--path] [--dump-preset] [--verbose]
 */

#include "ctk/ctk_api.h"
#include "ctk/ctk_log.h"
#include "cli_options.h"
#include "launcher_preset.h"

#include <cstdio>
#include <string>
#include <vector>

namespace {

constexpr int kExitLocked = 0;
constexpr int kExitFault  = 1;
constexpr int kExitUsage  = 2;

void PrintPath() {
    size_t count = CTK_GetDisplayTrajectory(nullptr, 0);
    std::vector<TrajectorySample> path(count);
    CTK_GetDisplayTrajectory(path.data(), path.size());

    std::printf("t_s,x_m,y_m,vx_ms,vy_ms\n");
    for (const TrajectorySample& s : path) {
        std::printf("%.4f,%.3f,%.3f,%.3f,%.3f\n", s.t_s, s.x_m, s.y_m, s.vx_ms, s.vy_ms);
    }
}

} // namespace

int main(int argc, char** argv) {
    CliOptions opt;
    if (!ParseArgs(argc, argv, opt)) {
        PrintUsage(argv[0]);
        return kExitUsage;
    }

    if (opt.verbose) {
        CTK_SetLogLevel(CTK_LogLevel::INFO);
    }

    CTK_Init();

    if (!opt.preset_path.empty()) {
        LauncherSpec spec;
        std::string error;
        if (!LoadLauncherPresetFile(opt.preset_path, spec, error)) {
            std::fprintf(stderr, "%s\n", error.c_str());
            return kExitUsage;
        }
        CTK_SetLauncherSpec(&spec);
    }

    if (opt.has_seed) {
        CTK_SeedScenarios(opt.seed);
        CTK_GenerateTarget();
    }
    if (opt.has_target) CTK_SetTargetRange(opt.target_m);
    if (opt.has_wind)   CTK_SetWind(opt.wind_ms);
    if (opt.has_angle)  CTK_SetLaunchAngle(opt.angle_deg);

    if (!CTK_SolveBlocking()) {
        std::fprintf(stderr, "no solution: mode=%u faults=0x%x\n",
                     static_cast<unsigned>(CTK_GetMode()), CTK_GetFaultFlags());
        return kExitFault;
    }

    SearchResult result;
    CTK_GetSearchResult(&result);

    LauncherSpec live;
    CTK_GetLauncherSpec(&live);

    std::printf("target      %.1f m (wind %+.1f m/s)\n", live.target_range_m, live.wind_ms);
    std::printf("stiffness   %.0f\n", result.stiffness);
    std::printf("angle       %.0f deg%s\n", result.angle_deg,
                result.auto_corrected ? " (auto-corrected)" : "");
    std::printf("residual    %.3f m\n", result.abs_error_m);

    ImpactReport report;
    if (CTK_Fire(&report)) {
        std::printf("impact      %.2f m (error %+.2f m, %s)\n", report.range_m,
                    report.impact_error_m, report.hit ? "hit" : "miss");
        std::printf("flight      %.2f s, %u steps%s\n", report.tof_s, report.steps,
                    report.impacted ? "" : ", no impact");
    }

    if (opt.dump_preset) {
        std::printf("%s\n", SerializeLauncherPreset(live).c_str());
    }

    if (opt.print_path) {
        PrintPath();
    }

    return kExitLocked;
}
