/**
 * @file solver.cpp
 * @brief Solution search implementation.
 */

#include "solver.h"
#include "ctk/ctk_log.h"
#include "../launch/launch_model.h"
#include "../flight/flight_integrator.h"
#include <cmath>
#include <limits>

double SolutionSearch::evaluateRange(const LauncherSpec& spec, double stiffness, double angle_deg) {
    LauncherSpec candidate = spec;
    candidate.stiffness = stiffness;
    candidate.angle_deg = angle_deg;

    ReleaseState release = LaunchModel::deriveRelease(candidate);
    return FlightIntegrator::integrateRange(release, candidate);
}

BisectionState SolutionSearch::bisectStep(const BisectionState& state, const LauncherSpec& spec,
                                          double angle_deg) {
    BisectionState next = state;

    const double mid = (state.lo + state.hi) * 0.5;
    const double range = evaluateRange(spec, mid, angle_deg);
    const double err = range - spec.target_range_m;
    next.best.evaluations++;

    if (std::fabs(err) < next.best.abs_error_m) {
        next.best.stiffness = mid;
        next.best.range_m = range;
        next.best.abs_error_m = std::fabs(err);
    }

    // Range grows with stiffness: overshoot → lower half
    if (err > 0.0) {
        next.hi = mid;
    } else {
        next.lo = mid;
    }
    return next;
}

StiffnessFit SolutionSearch::solveStiffnessForAngle(const LauncherSpec& spec, double angle_deg) {
    BisectionState state;
    state.lo = CTK_STIFFNESS_MIN;
    state.hi = CTK_STIFFNESS_MAX;
    state.best.stiffness = CTK_STIFFNESS_MIN;
    state.best.range_m = 0.0;
    state.best.abs_error_m = std::numeric_limits<double>::infinity();
    state.best.evaluations = 0;

    for (uint32_t i = 0; i < CTK_BISECTION_ITERATIONS; ++i) {
        state = bisectStep(state, spec, angle_deg);
    }
    return state.best;
}

std::vector<double> SolutionSearch::sweepAngles() {
    std::vector<double> angles;
    const int count = static_cast<int>(
        std::floor((CTK_SWEEP_ANGLE_MAX_DEG - CTK_SWEEP_ANGLE_MIN_DEG) / CTK_SWEEP_ANGLE_STEP_DEG + 0.5)) + 1;
    angles.reserve(count);
    for (int i = 0; i < count; ++i) {
        angles.push_back(CTK_SWEEP_ANGLE_MIN_DEG + i * CTK_SWEEP_ANGLE_STEP_DEG);
    }
    return angles;
}

AngleFit SolutionSearch::keepBetter(const AngleFit& best, const AngleFit& candidate) {
    AngleFit out = candidate.fit.abs_error_m < best.fit.abs_error_m ? candidate : best;
    out.fit.evaluations = best.fit.evaluations + candidate.fit.evaluations;
    return out;
}

AngleFit SolutionSearch::sweepBestAngle(const LauncherSpec& spec, const AngleFit& seed) {
    AngleFit best = seed;
    for (double angle : sweepAngles()) {
        AngleFit candidate;
        candidate.angle_deg = angle;
        candidate.fit = solveStiffnessForAngle(spec, angle);
        CTK_LOG_DEBUG("sweep angle=%.0f stiffness=%.1f error=%.3f",
                      angle, candidate.fit.stiffness, candidate.fit.abs_error_m);
        best = keepBetter(best, candidate);
    }
    return best;
}

double SolutionSearch::roundHalfUp(double value) {
    return std::floor(value + 0.5);
}

SearchResult SolutionSearch::solve(const LauncherSpec& spec) {
    AngleFit requested;
    requested.angle_deg = spec.angle_deg;
    requested.fit = solveStiffnessForAngle(spec, spec.angle_deg);

    AngleFit chosen = requested;
    uint32_t evaluations = requested.fit.evaluations;

    if (requested.fit.abs_error_m > CTK_SWEEP_TRIGGER_ERROR_M) {
        AngleFit swept = sweepBestAngle(spec, requested);
        evaluations = swept.fit.evaluations;

        // Only take the swept angle when it actually fits
        if (swept.fit.abs_error_m <= CTK_SWEEP_ACCEPT_ERROR_M) {
            chosen = swept;
        } else {
            CTK_LOG_DEBUG("sweep best error %.3f m rejected, keeping requested angle",
                          swept.fit.abs_error_m);
        }
    }

    SearchResult result;
    result.stiffness = roundHalfUp(chosen.fit.stiffness);
    result.angle_deg = roundHalfUp(chosen.angle_deg);
    result.requested_angle_deg = spec.angle_deg;

    // Report the residual of the setting actually handed back
    result.range_m = evaluateRange(spec, result.stiffness, result.angle_deg);
    result.abs_error_m = std::fabs(result.range_m - spec.target_range_m);
    result.auto_corrected = chosen.angle_deg != requested.angle_deg;
    result.evaluations = evaluations;

    CTK_LOG_DEBUG("target=%.1f stiffness=%.0f angle=%.0f error=%.3f auto=%d evals=%u",
                  spec.target_range_m, result.stiffness, result.angle_deg,
                  result.abs_error_m, result.auto_corrected ? 1 : 0, result.evaluations);
    return result;
}
