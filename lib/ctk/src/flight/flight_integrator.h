/**
 * @file flight_integrator.h
 * @brief Fixed-step projectile flight to ground impact.
 *
 * Semi-implicit (Euler-Cromer) integration: velocity is advanced with the
 * acceleration evaluated at the start of the step, then position is advanced
 * with the updated velocity. Drag and wind use the previous step's velocity.
 * Range-only and path modes share the same step logic.
 */

#pragma once

#include "ctk/ctk_config.h"
#include "ctk/ctk_types.h"
#include <vector>

/**
 * Step size and step limit. Defaults are the kernel constants; a finer step
 * is only for convergence checks.
 */
struct IntegratorConfig {
    double   step_s    = CTK_DT_S;
    uint32_t max_steps = CTK_MAX_FLIGHT_STEPS;
};

/**
 * Result from a single flight integration.
 */
struct FlightResult {
    double   range_m;          // x at the terminating sample
    double   tof_s;            // elapsed flight time
    double   impact_vx_ms;     // velocity at the terminating sample
    double   impact_vy_ms;
    uint32_t steps;            // steps taken
    bool     impacted;         // false: step limit reached, range_m is the last x
};

class FlightIntegrator {
public:
    /**
     * Integrate from a release state until the projectile crosses y = 0.
     * Never fails: if the step limit runs out the last horizontal position is
     * returned with impacted = false.
     */
    static FlightResult integrate(const ReleaseState& start, const LauncherSpec& spec,
                                  const IntegratorConfig& config = IntegratorConfig());

    // Range-only convenience wrapper
    static double integrateRange(const ReleaseState& start, const LauncherSpec& spec,
                                 const IntegratorConfig& config = IntegratorConfig());

    /**
     * Integrate and record the path. out_path is cleared, then receives the
     * release sample (t = 0) and one sample per step, the terminating sample
     * last.
     */
    static FlightResult integratePath(const ReleaseState& start, const LauncherSpec& spec,
                                      std::vector<TrajectorySample>& out_path,
                                      const IntegratorConfig& config = IntegratorConfig());

    /**
     * Thin a path for display: the first sample, then at most one sample per
     * interval_s, capped at max_samples. The final sample is always kept.
     */
    static std::vector<TrajectorySample> decimate(const std::vector<TrajectorySample>& path,
                                                  double interval_s = CTK_PATH_DISPLAY_INTERVAL_S,
                                                  uint32_t max_samples = CTK_PATH_DISPLAY_MAX_SAMPLES);

private:
    static FlightResult run(const ReleaseState& start, const LauncherSpec& spec,
                            const IntegratorConfig& config,
                            std::vector<TrajectorySample>* path);
};
