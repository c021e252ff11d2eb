/**
 * @file ctk_api.cpp
 * @brief C-linkage API implementation: wraps the CTK_Engine singleton.
 */

#include "ctk/ctk_api.h"
#include "engine/ctk_engine.h"
#include <algorithm>

// Single static engine instance
static CTK_Engine s_engine;

extern "C" {

void CTK_Init(void) {
    s_engine.init();
}

void CTK_SetLauncherSpec(const LauncherSpec* spec) {
    s_engine.setLauncherSpec(spec);
}

void CTK_GetLauncherSpec(LauncherSpec* out) {
    s_engine.getLauncherSpec(out);
}

void CTK_SetLaunchAngle(double angle_deg) {
    s_engine.setLaunchAngle(angle_deg);
}

void CTK_SetWind(double wind_ms) {
    s_engine.setWind(wind_ms);
}

void CTK_SetTargetRange(double range_m) {
    s_engine.setTargetRange(range_m);
}

void CTK_SetStiffness(double stiffness) {
    s_engine.setStiffness(stiffness);
}

void CTK_SeedScenarios(uint32_t seed) {
    s_engine.seedScenarios(seed);
}

void CTK_GenerateTarget(void) {
    s_engine.generateTarget();
}

bool CTK_StartSolve(void) {
    return s_engine.startSolve();
}

void CTK_Update(void) {
    s_engine.update();
}

bool CTK_SolveBlocking(void) {
    return s_engine.solveBlocking();
}

bool CTK_GetSearchResult(SearchResult* out) {
    return s_engine.getSearchResult(out);
}

bool CTK_Fire(ImpactReport* out) {
    if (!s_engine.fire()) {
        return false;
    }
    s_engine.getImpactReport(out);
    return true;
}

bool CTK_GetImpactReport(ImpactReport* out) {
    return s_engine.getImpactReport(out);
}

size_t CTK_GetTrajectory(TrajectorySample* out, size_t capacity) {
    const auto& path = s_engine.getTrajectory();
    if (out && capacity > 0) {
        std::copy_n(path.begin(), std::min(capacity, path.size()), out);
    }
    return path.size();
}

size_t CTK_GetDisplayTrajectory(TrajectorySample* out, size_t capacity) {
    const std::vector<TrajectorySample> path = s_engine.getDisplayTrajectory();
    if (out && capacity > 0) {
        std::copy_n(path.begin(), std::min(capacity, path.size()), out);
    }
    return path.size();
}

CTK_Mode CTK_GetMode(void) {
    return s_engine.getMode();
}

uint32_t CTK_GetFaultFlags(void) {
    return s_engine.getFaultFlags();
}

uint32_t CTK_GetDiagFlags(void) {
    return s_engine.getDiagFlags();
}

} // extern "C"
