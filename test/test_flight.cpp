/**
 * @file test_flight.cpp
 * @brief Flight integrator tests against closed-form and limiting cases.
 */

#include <gtest/gtest.h>
#include "../lib/ctk/src/flight/flight_integrator.h"
#include "../lib/ctk/src/launch/launch_model.h"
#include "ctk/ctk_config.h"
#include <cmath>
#include <vector>

class FlightTest : public ::testing::Test {
protected:
    LauncherSpec spec;

    void SetUp() override {
        spec = {};
        spec.stiffness = 4000.0;
        spec.arm_length_m = 6.0;
        spec.arm_mass_kg = 25.0;
        spec.proj_mass_kg = 10.0;
        spec.angle_deg = 45.0;
        spec.target_range_m = 150.0;
        spec.wind_ms = 0.0;
        spec.drag_coeff = 0.05;
    }

    // Vacuum range from a raised release point: x0 + vx · t_land
    static double closedFormRange(const ReleaseState& rs) {
        double g = CTK_GRAVITY;
        double t = (rs.vy_ms + std::sqrt(rs.vy_ms * rs.vy_ms + 2.0 * g * rs.y_m)) / g;
        return rs.x_m + rs.vx_ms * t;
    }
};

// With drag and wind removed, a fine step converges on the vacuum solution
TEST_F(FlightTest, VacuumConvergesToClosedForm) {
    spec.drag_coeff = 0.0;
    ReleaseState rs = LaunchModel::deriveRelease(spec);

    IntegratorConfig fine;
    fine.step_s = 1.0e-4;
    fine.max_steps = 1000000;

    FlightResult r = FlightIntegrator::integrate(rs, spec, fine);
    ASSERT_TRUE(r.impacted);
    EXPECT_NEAR(r.range_m, closedFormRange(rs), 1e-2);
}

// At the default step the overshoot is bounded by a couple of horizontal steps
TEST_F(FlightTest, VacuumDefaultStepCloseToClosedForm) {
    spec.drag_coeff = 0.0;
    ReleaseState rs = LaunchModel::deriveRelease(spec);

    FlightResult r = FlightIntegrator::integrate(rs, spec);
    ASSERT_TRUE(r.impacted);
    EXPECT_NEAR(r.range_m, closedFormRange(rs), 2.0 * rs.vx_ms * CTK_DT_S);
}

// Drag only ever removes range
TEST_F(FlightTest, DragShortensRange) {
    ReleaseState rs = LaunchModel::deriveRelease(spec);
    double with_drag = FlightIntegrator::integrateRange(rs, spec);

    LauncherSpec vacuum = spec;
    vacuum.drag_coeff = 0.0;
    double without_drag = FlightIntegrator::integrateRange(rs, vacuum);

    EXPECT_LT(with_drag, without_drag);
}

// Positive wind pushes back toward the launcher, negative wind carries further
TEST_F(FlightTest, WindDirection) {
    ReleaseState rs = LaunchModel::deriveRelease(spec);
    double calm = FlightIntegrator::integrateRange(rs, spec);

    spec.wind_ms = 10.0;
    double head = FlightIntegrator::integrateRange(rs, spec);
    spec.wind_ms = -10.0;
    double tail = FlightIntegrator::integrateRange(rs, spec);

    EXPECT_LT(head, calm);
    EXPECT_GT(tail, calm);
}

// Default launcher lands near 52 m
TEST_F(FlightTest, DefaultLauncherRange) {
    ReleaseState rs = LaunchModel::deriveRelease(spec);
    FlightResult r = FlightIntegrator::integrate(rs, spec);
    EXPECT_TRUE(r.impacted);
    EXPECT_NEAR(r.range_m, 52.15, 0.5);
    EXPECT_GT(r.tof_s, 0.0);
    EXPECT_NEAR(r.tof_s, r.steps * CTK_DT_S, 1e-9);
}

// Running out of steps returns the last x instead of failing
TEST_F(FlightTest, StepBudgetExhausted) {
    ReleaseState rs = LaunchModel::deriveRelease(spec);
    IntegratorConfig tiny;
    tiny.max_steps = 10;

    FlightResult r = FlightIntegrator::integrate(rs, spec, tiny);
    EXPECT_FALSE(r.impacted);
    EXPECT_EQ(r.steps, 10u);
    EXPECT_TRUE(std::isfinite(r.range_m));
    EXPECT_GT(r.range_m, rs.x_m);
}

// A still projectile above ground falls straight down without NaN
TEST_F(FlightTest, ZeroSpeedReleaseFallsStraight) {
    ReleaseState rs = {3.0, 10.0, 0.0, 0.0};
    FlightResult r = FlightIntegrator::integrate(rs, spec);
    EXPECT_TRUE(r.impacted);
    EXPECT_DOUBLE_EQ(r.range_m, 3.0);
    EXPECT_TRUE(std::isfinite(r.impact_vy_ms));
    EXPECT_LT(r.impact_vy_ms, 0.0);
}

// A release already below ground terminates after the first step
TEST_F(FlightTest, ReleaseBelowGroundTerminates) {
    spec.angle_deg = 10.0;
    ReleaseState rs = LaunchModel::deriveRelease(spec);
    ASSERT_LT(rs.y_m, 0.0);

    FlightResult r = FlightIntegrator::integrate(rs, spec);
    EXPECT_TRUE(r.impacted);
    EXPECT_EQ(r.steps, 1u);
}

// Path mode and range mode agree on every field
TEST_F(FlightTest, PathMatchesRangeMode) {
    spec.wind_ms = 4.5;
    ReleaseState rs = LaunchModel::deriveRelease(spec);

    std::vector<TrajectorySample> path;
    FlightResult with_path = FlightIntegrator::integratePath(rs, spec, path);
    FlightResult range_only = FlightIntegrator::integrate(rs, spec);

    EXPECT_DOUBLE_EQ(with_path.range_m, range_only.range_m);
    EXPECT_EQ(with_path.steps, range_only.steps);
    EXPECT_DOUBLE_EQ(with_path.tof_s, range_only.tof_s);

    ASSERT_EQ(path.size(), static_cast<size_t>(with_path.steps) + 1);
    EXPECT_DOUBLE_EQ(path.front().x_m, rs.x_m);
    EXPECT_DOUBLE_EQ(path.front().y_m, rs.y_m);
    EXPECT_DOUBLE_EQ(path.front().t_s, 0.0);
    EXPECT_DOUBLE_EQ(path.back().x_m, with_path.range_m);
    EXPECT_LE(path.back().y_m, 0.0);

    // Only the last sample is at or below ground
    for (size_t i = 1; i + 1 < path.size(); ++i) {
        EXPECT_GT(path[i].y_m, 0.0) << "sample " << i;
    }
}

TEST_F(FlightTest, PathClearsPreviousContents) {
    ReleaseState rs = LaunchModel::deriveRelease(spec);
    std::vector<TrajectorySample> path(1000);
    FlightResult r = FlightIntegrator::integratePath(rs, spec, path);
    EXPECT_EQ(path.size(), static_cast<size_t>(r.steps) + 1);
}

// Display thinning keeps the endpoints and respects the cap
TEST_F(FlightTest, DecimateKeepsEndpoints) {
    ReleaseState rs = LaunchModel::deriveRelease(spec);
    std::vector<TrajectorySample> path;
    FlightIntegrator::integratePath(rs, spec, path);

    std::vector<TrajectorySample> shown = FlightIntegrator::decimate(path);
    ASSERT_GE(shown.size(), 2u);
    EXPECT_LT(shown.size(), path.size());
    EXPECT_DOUBLE_EQ(shown.front().t_s, 0.0);
    EXPECT_DOUBLE_EQ(shown.back().x_m, path.back().x_m);

    for (size_t i = 1; i < shown.size(); ++i) {
        EXPECT_GT(shown[i].t_s, shown[i - 1].t_s);
    }
    // Roughly one sample per display interval over the flight
    double flight_s = path.back().t_s;
    EXPECT_LE(shown.size(), static_cast<size_t>(flight_s / CTK_PATH_DISPLAY_INTERVAL_S) + 2);

    std::vector<TrajectorySample> capped = FlightIntegrator::decimate(path, 0.0, 20);
    EXPECT_LE(capped.size(), 20u);
    EXPECT_DOUBLE_EQ(capped.back().x_m, path.back().x_m);
}

TEST_F(FlightTest, DecimateEmptyPath) {
    std::vector<TrajectorySample> empty;
    EXPECT_TRUE(FlightIntegrator::decimate(empty).empty());
}
