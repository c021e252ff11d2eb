/**
 * @file ctk_engine.cpp
 * @brief CTK engine implementation: the lifecycle owner.
 *
 * Pipeline per solve:
 *   1. Snapshot the live spec
 *   2. Run SolutionSearch::solve on a worker
 *   3. On collection, drop the result if any input changed meanwhile
 *   4. Otherwise commit rounded stiffness and angle into the live spec → LOCKED
 */

#include "ctk_engine.h"
#include "ctk/ctk_log.h"
#include "../launch/launch_model.h"
#include "../flight/flight_integrator.h"
#include "../solver/solver.h"
#include <chrono>
#include <cmath>
#include <cstring>
#include <system_error>

namespace {

const char* modeName(CTK_Mode mode) {
    switch (mode) {
        case CTK_Mode::IDLE:        return "IDLE";
        case CTK_Mode::CALCULATING: return "CALCULATING";
        case CTK_Mode::LOCKED:      return "LOCKED";
        case CTK_Mode::FAULT:       return "FAULT";
        default:                    return "?";
    }
}

LauncherSpec defaultSpec() {
    LauncherSpec s;
    s.stiffness = CTK_DEFAULT_STIFFNESS;
    s.arm_length_m = CTK_DEFAULT_ARM_LENGTH_M;
    s.arm_mass_kg = CTK_DEFAULT_ARM_MASS_KG;
    s.proj_mass_kg = CTK_DEFAULT_PROJ_MASS_KG;
    s.angle_deg = CTK_DEFAULT_ANGLE_DEG;
    s.target_range_m = CTK_DEFAULT_TARGET_M;
    s.wind_ms = CTK_DEFAULT_WIND_MS;
    s.drag_coeff = CTK_DEFAULT_DRAG_COEFF;
    return s;
}

} // namespace

void CTK_Engine::init() {
    // Let any running search finish before its result is thrown away
    if (job_.valid()) {
        job_.wait();
        job_ = std::future<SearchResult>();
    }

    spec_ = defaultSpec();

    std::memset(&result_, 0, sizeof(result_));
    std::memset(&impact_, 0, sizeof(impact_));
    has_result_ = false;
    has_impact_ = false;
    trajectory_.clear();

    scenarios_.reseed(0);

    generation_++;
    job_generation_ = 0;

    fault_flags_ = 0;
    diag_flags_ = CTK_Diag::DEFAULT_SPEC;
    evaluateState();
}

void CTK_Engine::setLauncherSpec(const LauncherSpec* spec) {
    if (!spec) return;
    spec_ = *spec;
    onInputChanged();
}

void CTK_Engine::setLaunchAngle(double angle_deg) {
    spec_.angle_deg = angle_deg;
    onInputChanged();
}

void CTK_Engine::setWind(double wind_ms) {
    spec_.wind_ms = wind_ms;
    onInputChanged();
}

void CTK_Engine::setTargetRange(double range_m) {
    spec_.target_range_m = range_m;
    onInputChanged();
}

void CTK_Engine::setStiffness(double stiffness) {
    spec_.stiffness = stiffness;
    onInputChanged();
}

void CTK_Engine::seedScenarios(uint32_t seed) {
    scenarios_.reseed(seed);
}

void CTK_Engine::generateTarget() {
    Scenario s = scenarios_.next();
    spec_.target_range_m = s.target_range_m;
    spec_.wind_ms = s.wind_ms;
    CTK_LOG_INFO("new target %.0f m, wind %.1f m/s", s.target_range_m, s.wind_ms);
    onInputChanged();
}

bool CTK_Engine::startSolve() {
    if (mode_ == CTK_Mode::FAULT) {
        CTK_LOG_WARN("solve refused: fault flags 0x%x", fault_flags_);
        return false;
    }
    if (mode_ == CTK_Mode::CALCULATING) {
        return false;
    }

    // A stale search may still be running; it must finish before we reuse job_
    if (job_.valid()) {
        collectJob(true);
    }

    const LauncherSpec snapshot = spec_;
    try {
        job_ = launchSearch(snapshot);
    } catch (const std::system_error& e) {
        CTK_LOG_ERROR("could not start search worker: %s", e.what());
        return false;
    }
    job_generation_ = generation_;

    diag_flags_ &= ~(CTK_Diag::AUTO_CORRECTED | CTK_Diag::SOLUTION_INEXACT |
                     CTK_Diag::STALE_RESULT_DISCARDED);
    mode_ = CTK_Mode::CALCULATING;
    CTK_LOG_INFO("solve started for target %.1f m at %.1f deg",
                 snapshot.target_range_m, snapshot.angle_deg);
    return true;
}

std::future<SearchResult> CTK_Engine::launchSearch(const LauncherSpec& snapshot) {
    return std::async(std::launch::async, [snapshot]() {
        return SolutionSearch::solve(snapshot);
    });
}

void CTK_Engine::update() {
    if (job_.valid()) {
        collectJob(false);
    }
}

bool CTK_Engine::solveBlocking() {
    if (!startSolve()) {
        return false;
    }
    collectJob(true);
    return mode_ == CTK_Mode::LOCKED;
}

bool CTK_Engine::fire() {
    if (mode_ == CTK_Mode::FAULT) {
        CTK_LOG_WARN("fire refused: fault flags 0x%x", fault_flags_);
        return false;
    }

    const LauncherSpec snapshot = spec_;
    ReleaseState release = LaunchModel::deriveRelease(snapshot);
    FlightResult flight = FlightIntegrator::integratePath(release, snapshot, trajectory_);

    impact_.range_m = flight.range_m;
    impact_.impact_error_m = flight.range_m - snapshot.target_range_m;
    impact_.tof_s = flight.tof_s;
    impact_.impact_speed_ms = std::sqrt(flight.impact_vx_ms * flight.impact_vx_ms +
                                        flight.impact_vy_ms * flight.impact_vy_ms);
    impact_.steps = flight.steps;
    impact_.impacted = flight.impacted;
    impact_.hit = std::fabs(impact_.impact_error_m) < CTK_HIT_RADIUS_M;
    has_impact_ = true;

    if (flight.impacted) {
        diag_flags_ &= ~CTK_Diag::FLIGHT_NO_IMPACT;
    } else {
        diag_flags_ |= CTK_Diag::FLIGHT_NO_IMPACT;
        CTK_LOG_WARN("shot did not reach the ground in %u steps", flight.steps);
    }

    CTK_LOG_INFO("impact at %.1f m, error %+.1f m", impact_.range_m, impact_.impact_error_m);
    return true;
}

void CTK_Engine::getLauncherSpec(LauncherSpec* out) const {
    if (out) {
        *out = spec_;
    }
}

bool CTK_Engine::getSearchResult(SearchResult* out) const {
    if (out && has_result_) {
        *out = result_;
    }
    return has_result_;
}

bool CTK_Engine::getImpactReport(ImpactReport* out) const {
    if (out && has_impact_) {
        *out = impact_;
    }
    return has_impact_;
}

std::vector<TrajectorySample> CTK_Engine::getDisplayTrajectory() const {
    return FlightIntegrator::decimate(trajectory_);
}

// ---------------------------------------------------------------------------
// Internal: input change
// ---------------------------------------------------------------------------

void CTK_Engine::onInputChanged() {
    generation_++;
    diag_flags_ &= ~(CTK_Diag::DEFAULT_SPEC | CTK_Diag::AUTO_CORRECTED |
                     CTK_Diag::SOLUTION_INEXACT);
    evaluateState();
}

// ---------------------------------------------------------------------------
// Internal: state machine evaluation
// ---------------------------------------------------------------------------

void CTK_Engine::evaluateState() {
    const CTK_Mode previous = mode_;

    fault_flags_ = LaunchModel::validate(spec_);
    refreshDomainDiags();

    mode_ = (fault_flags_ != 0) ? CTK_Mode::FAULT : CTK_Mode::IDLE;

    if (mode_ == CTK_Mode::FAULT && previous != CTK_Mode::FAULT) {
        CTK_LOG_WARN("launcher spec rejected: fault flags 0x%x", fault_flags_);
    } else if (mode_ != previous) {
        CTK_LOG_INFO("%s -> %s", modeName(previous), modeName(mode_));
    }
}

// Angle/wind domain flags always describe the current live spec
void CTK_Engine::refreshDomainDiags() {
    diag_flags_ &= ~(CTK_Diag::ANGLE_OUT_OF_RANGE | CTK_Diag::WIND_OUT_OF_RANGE);
    if (spec_.angle_deg < CTK_ANGLE_MIN_DEG || spec_.angle_deg > CTK_ANGLE_MAX_DEG) {
        diag_flags_ |= CTK_Diag::ANGLE_OUT_OF_RANGE;
    }
    if (spec_.wind_ms < CTK_WIND_MIN_MS || spec_.wind_ms > CTK_WIND_MAX_MS) {
        diag_flags_ |= CTK_Diag::WIND_OUT_OF_RANGE;
    }
}

// ---------------------------------------------------------------------------
// Internal: worker collection
// ---------------------------------------------------------------------------

void CTK_Engine::collectJob(bool wait) {
    if (!wait && job_.wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
        return;
    }

    SearchResult result = job_.get();

    if (job_generation_ != generation_) {
        diag_flags_ |= CTK_Diag::STALE_RESULT_DISCARDED;
        CTK_LOG_WARN("discarded search result for superseded inputs");
        return;
    }

    commitResult(result);
}

void CTK_Engine::commitResult(const SearchResult& result) {
    result_ = result;
    has_result_ = true;

    // The kernel is the source of these values; not an input change
    spec_.stiffness = result.stiffness;
    spec_.angle_deg = result.angle_deg;
    refreshDomainDiags();

    if (result.auto_corrected) {
        diag_flags_ |= CTK_Diag::AUTO_CORRECTED;
    }
    if (result.abs_error_m > CTK_SWEEP_ACCEPT_ERROR_M) {
        diag_flags_ |= CTK_Diag::SOLUTION_INEXACT;
    }

    mode_ = CTK_Mode::LOCKED;
    CTK_LOG_INFO("LOCKED stiffness=%.0f angle=%.0f error=%.2f m%s",
                 result.stiffness, result.angle_deg, result.abs_error_m,
                 result.auto_corrected ? " (angle auto-corrected)" : "");
}
