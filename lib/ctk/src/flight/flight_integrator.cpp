/**
 * @file flight_integrator.cpp
 * @brief Flight integrator implementation.
 *
 * Coordinate system:
 *   X = downrange (horizontal)
 *   Y = vertical (up positive, ground at y = 0)
 */

#include "flight_integrator.h"
#include "ctk/ctk_log.h"
#include "../drag/drag_model.h"
#include "../corrections/wind.h"
#include <cmath>

namespace {

TrajectorySample makeSample(double x, double y, double vx, double vy, double t) {
    TrajectorySample s;
    s.x_m = x;
    s.y_m = y;
    s.vx_ms = vx;
    s.vy_ms = vy;
    s.t_s = t;
    return s;
}

} // namespace

FlightResult FlightIntegrator::integrate(const ReleaseState& start, const LauncherSpec& spec,
                                         const IntegratorConfig& config) {
    return run(start, spec, config, nullptr);
}

double FlightIntegrator::integrateRange(const ReleaseState& start, const LauncherSpec& spec,
                                        const IntegratorConfig& config) {
    return run(start, spec, config, nullptr).range_m;
}

FlightResult FlightIntegrator::integratePath(const ReleaseState& start, const LauncherSpec& spec,
                                             std::vector<TrajectorySample>& out_path,
                                             const IntegratorConfig& config) {
    out_path.clear();
    return run(start, spec, config, &out_path);
}

FlightResult FlightIntegrator::run(const ReleaseState& start, const LauncherSpec& spec,
                                   const IntegratorConfig& config,
                                   std::vector<TrajectorySample>* path) {
    double x = start.x_m;
    double y = start.y_m;
    double vx = start.vx_ms;
    double vy = start.vy_ms;
    double t = 0.0;

    FlightResult result;
    result.range_m = x;
    result.tof_s = 0.0;
    result.impact_vx_ms = vx;
    result.impact_vy_ms = vy;
    result.steps = 0;
    result.impacted = false;

    if (path) {
        path->reserve(config.max_steps + 1);
        path->push_back(makeSample(x, y, vx, vy, t));
    }

    // Acceleration divides by mass; a massless projectile has no trajectory.
    if (!(spec.proj_mass_kg > 0.0)) {
        CTK_LOG_DEBUG("projectile mass %.3f kg, skipping flight", spec.proj_mass_kg);
        return result;
    }

    const double dt = (config.step_s > 0.0) ? config.step_s : CTK_DT_S;
    const double inv_mass = 1.0 / spec.proj_mass_kg;
    const double wind_force = WindCorrection::horizontalForce(spec.wind_ms);

    uint32_t step = 0;
    while (step < config.max_steps) {
        step++;

        double drag_fx, drag_fy;
        DragModel::getForceComponents(vx, vy, spec.drag_coeff, drag_fx, drag_fy);

        const double ax = (drag_fx + wind_force) * inv_mass;
        const double ay = drag_fy * inv_mass - CTK_GRAVITY;

        // Euler-Cromer: velocity first, then position with the new velocity
        vx += ax * dt;
        vy += ay * dt;
        x += vx * dt;
        y += vy * dt;
        t += dt;

        if (path) {
            path->push_back(makeSample(x, y, vx, vy, t));
        }

        if (y <= 0.0) {
            result.impacted = true;
            break;
        }
    }

    result.range_m = x;
    result.tof_s = t;
    result.impact_vx_ms = vx;
    result.impact_vy_ms = vy;
    result.steps = step;

    if (!result.impacted) {
        CTK_LOG_DEBUG("step limit of %u exhausted at x=%.2f y=%.2f",
                      config.max_steps, x, y);
    }
    return result;
}

std::vector<TrajectorySample> FlightIntegrator::decimate(const std::vector<TrajectorySample>& path,
                                                         double interval_s,
                                                         uint32_t max_samples) {
    std::vector<TrajectorySample> out;
    if (path.empty() || max_samples == 0) {
        return out;
    }

    out.push_back(path.front());
    double next_t = path.front().t_s + interval_s;

    for (size_t i = 1; i + 1 < path.size() && out.size() < max_samples; ++i) {
        if (interval_s <= 0.0 || path[i].t_s >= next_t) {
            out.push_back(path[i]);
            next_t += interval_s;
            while (interval_s > 0.0 && next_t <= path[i].t_s) next_t += interval_s;
        }
    }

    if (path.size() > 1) {
        if (out.size() >= max_samples) {
            out.back() = path.back();
        } else {
            out.push_back(path.back());
        }
    }
    return out;
}
