/**
 * @file solver.h
 * @brief Launcher setting search for a target range.
 *
 * Two nested searches over the launch model and flight integrator:
 *   - inner: bisection on stiffness at a fixed angle, relying on range being
 *     non-decreasing in stiffness,
 *   - outer: a fixed sweep of launch angles, run only when the requested angle
 *     misses by more than CTK_SWEEP_TRIGGER_ERROR_M.
 * Both are bounded folds with an explicit best-so-far accumulator, so every
 * call terminates after a fixed number of evaluations and is deterministic.
 */

#pragma once

#include "ctk/ctk_config.h"
#include "ctk/ctk_types.h"
#include <vector>

/**
 * Best stiffness seen at one angle.
 */
struct StiffnessFit {
    double   stiffness;
    double   range_m;
    double   abs_error_m;
    uint32_t evaluations;
};

/**
 * Bisection accumulator: current bracket plus best candidate over all
 * evaluations, not just the final midpoint.
 */
struct BisectionState {
    double       lo;
    double       hi;
    StiffnessFit best;
};

/**
 * Best (angle, stiffness) pair seen by the angle sweep.
 */
struct AngleFit {
    double       angle_deg;
    StiffnessFit fit;
};

class SolutionSearch {
public:
    /**
     * Range reached by the spec with stiffness and angle overridden.
     */
    static double evaluateRange(const LauncherSpec& spec, double stiffness, double angle_deg);

    /**
     * Inner search: CTK_BISECTION_ITERATIONS bisection steps over
     * [CTK_STIFFNESS_MIN, CTK_STIFFNESS_MAX] at the given angle.
     */
    static StiffnessFit solveStiffnessForAngle(const LauncherSpec& spec, double angle_deg);

    /**
     * One bisection step: evaluate the midpoint, keep it if it beats the best
     * seen, and move the bracket toward the target.
     */
    static BisectionState bisectStep(const BisectionState& state, const LauncherSpec& spec,
                                     double angle_deg);

    // Angles tried by the outer sweep, ascending
    static std::vector<double> sweepAngles();

    /**
     * Outer search: run the inner search at every sweep angle and fold the
     * results into seed, replacing it only on a strictly smaller error.
     */
    static AngleFit sweepBestAngle(const LauncherSpec& spec, const AngleFit& seed);

    /**
     * Full search for spec.target_range_m starting at spec.angle_deg.
     * Never fails; the caller must check abs_error_m.
     */
    static SearchResult solve(const LauncherSpec& spec);

    // Nearest integer, halves rounded up
    static double roundHalfUp(double value);

private:
    static AngleFit keepBetter(const AngleFit& best, const AngleFit& candidate);
};
