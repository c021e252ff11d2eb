/**
 * @file ctk_engine.h
 * @brief Top-level CTK engine: owns the live launcher spec.
 *
 * Implements the solver lifecycle (IDLE / CALCULATING / LOCKED / FAULT) around
 * the stateless kernel. Every kernel call receives a snapshot of the live spec;
 * searches run on a worker and report back through a single SearchResult.
 * Changing any input while a search runs makes that search stale: its result
 * is discarded when collected.
 */

#pragma once

#include "ctk/ctk_types.h"
#include "ctk/ctk_config.h"
#include "../scenario/scenario_generator.h"
#include <future>
#include <vector>

class CTK_Engine {
public:
    virtual ~CTK_Engine() = default;

    void init();

    // --- Inputs (each returns the lifecycle to IDLE, or FAULT) ---
    void setLauncherSpec(const LauncherSpec* spec);
    void setLaunchAngle(double angle_deg);
    void setWind(double wind_ms);
    void setTargetRange(double range_m);
    void setStiffness(double stiffness);

    // --- Scenarios ---
    void seedScenarios(uint32_t seed);
    void generateTarget();

    // --- Solving ---
    bool startSolve();
    void update();
    bool solveBlocking();

    // --- Firing ---
    bool fire();

    // --- Output ---
    void getLauncherSpec(LauncherSpec* out) const;
    bool getSearchResult(SearchResult* out) const;
    bool getImpactReport(ImpactReport* out) const;
    const std::vector<TrajectorySample>& getTrajectory() const { return trajectory_; }
    std::vector<TrajectorySample> getDisplayTrajectory() const;
    CTK_Mode getMode() const { return mode_; }
    uint32_t getFaultFlags() const { return fault_flags_; }
    uint32_t getDiagFlags() const { return diag_flags_; }

protected:
    // Start the worker for one search; throws std::system_error if no thread
    virtual std::future<SearchResult> launchSearch(const LauncherSpec& snapshot);

private:
    LauncherSpec spec_;

    // State
    CTK_Mode mode_ = CTK_Mode::IDLE;
    uint32_t fault_flags_ = 0;
    uint32_t diag_flags_ = 0;

    // Latest search result
    SearchResult result_;
    bool has_result_ = false;

    // Latest shot
    ImpactReport impact_;
    bool has_impact_ = false;
    std::vector<TrajectorySample> trajectory_;

    ScenarioGenerator scenarios_;

    // Worker search; job_generation_ != generation_ means stale
    std::future<SearchResult> job_;
    uint32_t generation_ = 0;
    uint32_t job_generation_ = 0;

    // --- Internal methods ---
    void onInputChanged();
    void evaluateState();
    void refreshDomainDiags();
    void collectJob(bool wait);
    void commitResult(const SearchResult& result);
};
