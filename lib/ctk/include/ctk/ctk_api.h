/**
 * @file ctk_api.h
 * @brief Public C-linkage API for the Catapult Targeting Kernel.
 *
 * This header is the ONLY file application code needs to include.
 * All functions operate on one static engine. Calls are expected from a
 * single thread; searches started with CTK_StartSolve run on a worker and are
 * collected by CTK_Update.
 */

#pragma once

#include "ctk_types.h"
#include "ctk_config.h"

#ifdef __cplusplus
#include <cstddef>
extern "C" {
#else
#include <stddef.h>
#endif

// ---------------------------------------------------------------------------
// Lifecycle
// ---------------------------------------------------------------------------

/**
 * Initialize the engine with the default launcher spec.
 * Must be called once before any other CTK function.
 */
void CTK_Init(void);

// ---------------------------------------------------------------------------
// Inputs: any change returns the solver to IDLE (or FAULT)
// ---------------------------------------------------------------------------

/**
 * Replace the whole live launcher spec.
 */
void CTK_SetLauncherSpec(const LauncherSpec* spec);

/**
 * Copy the live launcher spec, including any committed solution.
 */
void CTK_GetLauncherSpec(LauncherSpec* out);

void CTK_SetLaunchAngle(double angle_deg);
void CTK_SetWind(double wind_ms);
void CTK_SetTargetRange(double range_m);
void CTK_SetStiffness(double stiffness);

/**
 * Seed the random scenario generator.
 */
void CTK_SeedScenarios(uint32_t seed);

/**
 * Pick a random target range and wind for the live spec.
 */
void CTK_GenerateTarget(void);

// ---------------------------------------------------------------------------
// Solving
// ---------------------------------------------------------------------------

/**
 * Start a search on a worker for the live spec's target.
 * @return false in FAULT or while a search is already running
 */
bool CTK_StartSolve(void);

/**
 * Collect a finished search, if any. Call once per frame.
 */
void CTK_Update(void);

/**
 * Run a search on the calling thread and commit it.
 * @return true if the engine ends LOCKED
 */
bool CTK_SolveBlocking(void);

/**
 * Retrieve the most recent committed search result.
 * @return false if no search has completed since CTK_Init
 */
bool CTK_GetSearchResult(SearchResult* out);

// ---------------------------------------------------------------------------
// Firing
// ---------------------------------------------------------------------------

/**
 * Fire with the live spec: integrate the full path and record an impact report.
 * @param out  Optional report destination
 * @return false in FAULT
 */
bool CTK_Fire(ImpactReport* out);

/**
 * Retrieve the report of the last shot.
 */
bool CTK_GetImpactReport(ImpactReport* out);

/**
 * Copy up to capacity samples of the last shot's path.
 * @return total number of samples available
 */
size_t CTK_GetTrajectory(TrajectorySample* out, size_t capacity);

/**
 * Same as CTK_GetTrajectory, thinned to one sample per
 * CTK_PATH_DISPLAY_INTERVAL_S and at most CTK_PATH_DISPLAY_MAX_SAMPLES.
 */
size_t CTK_GetDisplayTrajectory(TrajectorySample* out, size_t capacity);

// ---------------------------------------------------------------------------
// Status
// ---------------------------------------------------------------------------

CTK_Mode CTK_GetMode(void);

/**
 * Get current fault flags (CTK_Fault bitfield).
 */
uint32_t CTK_GetFaultFlags(void);

/**
 * Get current diagnostic flags (CTK_Diag bitfield).
 */
uint32_t CTK_GetDiagFlags(void);

#ifdef __cplusplus
} // extern "C"
#endif
