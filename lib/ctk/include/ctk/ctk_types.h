/**
 * @file ctk_types.h
 * @brief All data structures for the Catapult Targeting Kernel.
 */

#pragma once

#include <cstdint>

// ---------------------------------------------------------------------------
// Solver Lifecycle Modes
// ---------------------------------------------------------------------------
enum class CTK_Mode : uint32_t {
    IDLE        = 0,  // Inputs changed since the last solution
    CALCULATING = 1,  // Search running
    LOCKED      = 2,  // Search result applied to the live spec
    FAULT       = 3   // Live spec outside the accepted domain
};

// ---------------------------------------------------------------------------
// Fault Flags (bitfield): block solving
// ---------------------------------------------------------------------------
namespace CTK_Fault {
    constexpr uint32_t NONE            = 0;
    constexpr uint32_t BAD_ARM_LENGTH  = (1u << 0);
    constexpr uint32_t BAD_PROJ_MASS   = (1u << 1);
    constexpr uint32_t BAD_ARM_MASS    = (1u << 2);
    constexpr uint32_t BAD_DRAG        = (1u << 3);
    constexpr uint32_t BAD_STIFFNESS   = (1u << 4);
    constexpr uint32_t BAD_TARGET      = (1u << 5);
    constexpr uint32_t NON_FINITE      = (1u << 6);
} // namespace CTK_Fault

// ---------------------------------------------------------------------------
// Diagnostic Flags (bitfield): informational, not faults
// ---------------------------------------------------------------------------
namespace CTK_Diag {
    constexpr uint32_t NONE                   = 0;
    constexpr uint32_t DEFAULT_SPEC           = (1u << 0);
    constexpr uint32_t AUTO_CORRECTED         = (1u << 1);
    constexpr uint32_t SOLUTION_INEXACT       = (1u << 2);
    constexpr uint32_t FLIGHT_NO_IMPACT       = (1u << 3);
    constexpr uint32_t STALE_RESULT_DISCARDED = (1u << 4);
    constexpr uint32_t ANGLE_OUT_OF_RANGE     = (1u << 5);
    constexpr uint32_t WIND_OUT_OF_RANGE      = (1u << 6);
} // namespace CTK_Diag

// ---------------------------------------------------------------------------
// LauncherSpec: one evaluation's worth of inputs
// ---------------------------------------------------------------------------
struct LauncherSpec {
    double stiffness;          // spring constant
    double arm_length_m;       // > 0
    double arm_mass_kg;        // >= 0
    double proj_mass_kg;       // > 0
    double angle_deg;          // launch angle above horizontal
    double target_range_m;     // > 0
    double wind_ms;            // signed horizontal wind (positive opposes flight)
    double drag_coeff;         // dimensionless, >= 0
};

// ---------------------------------------------------------------------------
// ReleaseState: projectile state at separation from the arm
// ---------------------------------------------------------------------------
struct ReleaseState {
    double x_m, y_m;           // position (pivot at x = 0)
    double vx_ms, vy_ms;       // velocity
};

// ---------------------------------------------------------------------------
// TrajectorySample: one point along an integrated path
// ---------------------------------------------------------------------------
struct TrajectorySample {
    double x_m, y_m;
    double vx_ms, vy_ms;
    double t_s;
};

// ---------------------------------------------------------------------------
// SearchResult: output of one solve
// ---------------------------------------------------------------------------
struct SearchResult {
    double stiffness;              // rounded to nearest integer
    double angle_deg;              // rounded to nearest integer
    double requested_angle_deg;    // angle the caller asked for
    double range_m;                // range at the rounded stiffness and angle
    double abs_error_m;            // |range_m - target|
    bool   auto_corrected;         // angle differs from the requested one
    uint32_t evaluations;          // search evaluations, excluding the final re-check
};

// ---------------------------------------------------------------------------
// ImpactReport: telemetry from a fired shot
// ---------------------------------------------------------------------------
struct ImpactReport {
    double   range_m;
    double   impact_error_m;       // range - target (signed)
    double   tof_s;
    double   impact_speed_ms;
    uint32_t steps;
    bool     impacted;             // false if the step limit ran out
    bool     hit;                  // |impact_error_m| < CTK_HIT_RADIUS_M
};
