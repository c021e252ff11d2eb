/**
 * @file ctk_config.h
 * @brief Compile-time constants for the Catapult Targeting Kernel.
 *
 * Physical constants, launcher geometry, integrator and search parameters,
 * and the input domains accepted by the engine.
 */

#pragma once

#include <cstdint>

// ---------------------------------------------------------------------------
// Version
// ---------------------------------------------------------------------------
#ifndef CTK_VERSION_MAJOR
#define CTK_VERSION_MAJOR 1
#endif
#ifndef CTK_VERSION_MINOR
#define CTK_VERSION_MINOR 0
#endif

// ---------------------------------------------------------------------------
// Physical Constants
// ---------------------------------------------------------------------------

// Gravitational acceleration (m/s²)
constexpr double CTK_GRAVITY = 9.81;

// Air density used by the quadratic drag term (kg/m³)
constexpr double CTK_AIR_DENSITY = 1.225;

// Reference cross-sectional area scale applied to the drag coefficient
constexpr double CTK_DRAG_AREA_SCALE = 0.05;

// Pi
constexpr double CTK_PI = 3.14159265358979323846;

// Conversion helpers
constexpr double CTK_DEG_TO_RAD = CTK_PI / 180.0;
constexpr double CTK_RAD_TO_DEG = 180.0 / CTK_PI;

// ---------------------------------------------------------------------------
// Launcher Geometry
// ---------------------------------------------------------------------------

// Height of the arm pivot above the ground plane (m)
constexpr double CTK_PIVOT_HEIGHT_M = 5.5;

// Angular travel of the arm from cocked to stop position (rad).
// Cocked at roughly -135 deg, so about 2.3 rad of travel.
constexpr double CTK_SWING_ARC_RAD = 2.3;

// Fraction of stored spring energy delivered to the arm at release
constexpr double CTK_MECHANICAL_EFFICIENCY = 0.4;

// Offset from the launch angle to the arm angle at release (deg).
// The arm is perpendicular to the release velocity.
constexpr double CTK_RELEASE_ARM_OFFSET_DEG = -90.0;

// ---------------------------------------------------------------------------
// Flight Integrator
// ---------------------------------------------------------------------------

// Fixed integration step (s)
constexpr double CTK_DT_S = 1.0 / 60.0;

// Step limit before the integrator gives up on reaching the ground
constexpr uint32_t CTK_MAX_FLIGHT_STEPS = 5000;

// Display decimation of a trajectory path
constexpr double   CTK_PATH_DISPLAY_INTERVAL_S = 0.05;
constexpr uint32_t CTK_PATH_DISPLAY_MAX_SAMPLES = 500;

// ---------------------------------------------------------------------------
// Solution Search
// ---------------------------------------------------------------------------

// Stiffness bisection bracket (N·m per rad²)
constexpr double CTK_STIFFNESS_MIN = 100.0;
constexpr double CTK_STIFFNESS_MAX = 150000.0;

// Bisection iterations per angle
constexpr uint32_t CTK_BISECTION_ITERATIONS = 40;

// Angle sweep used when the requested angle cannot reach the target (deg)
constexpr double CTK_SWEEP_ANGLE_MIN_DEG  = 15.0;
constexpr double CTK_SWEEP_ANGLE_MAX_DEG  = 75.0;
constexpr double CTK_SWEEP_ANGLE_STEP_DEG = 5.0;

// Residual above which the angle sweep runs (m)
constexpr double CTK_SWEEP_TRIGGER_ERROR_M = 1.0;

// Residual below which a swept angle replaces the requested one (m)
constexpr double CTK_SWEEP_ACCEPT_ERROR_M = 2.0;

// ---------------------------------------------------------------------------
// Engine Input Domains
// ---------------------------------------------------------------------------
constexpr double CTK_ANGLE_MIN_DEG = 10.0;
constexpr double CTK_ANGLE_MAX_DEG = 80.0;
constexpr double CTK_WIND_MIN_MS   = -20.0;
constexpr double CTK_WIND_MAX_MS   = 20.0;

// Impact error considered a hit (m)
constexpr double CTK_HIT_RADIUS_M = 5.0;

// ---------------------------------------------------------------------------
// Scenario Generator
// ---------------------------------------------------------------------------
constexpr double CTK_SCENARIO_TARGET_MIN_M = 50.0;
constexpr double CTK_SCENARIO_TARGET_MAX_M = 400.0;
constexpr double CTK_SCENARIO_WIND_MIN_MS  = -20.0;
constexpr double CTK_SCENARIO_WIND_MAX_MS  = 20.0;

// ---------------------------------------------------------------------------
// Default Launcher
// ---------------------------------------------------------------------------
constexpr double CTK_DEFAULT_STIFFNESS      = 4000.0;
constexpr double CTK_DEFAULT_ARM_LENGTH_M   = 6.0;
constexpr double CTK_DEFAULT_ARM_MASS_KG    = 25.0;
constexpr double CTK_DEFAULT_PROJ_MASS_KG   = 10.0;
constexpr double CTK_DEFAULT_ANGLE_DEG      = 45.0;
constexpr double CTK_DEFAULT_TARGET_M       = 150.0;
constexpr double CTK_DEFAULT_WIND_MS        = 0.0;
constexpr double CTK_DEFAULT_DRAG_COEFF     = 0.05;
