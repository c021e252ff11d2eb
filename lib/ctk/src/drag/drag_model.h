/**
 * @file drag_model.h
 * @brief Quadratic aerodynamic drag on the projectile.
 *
 * F = ½ ρ v² Cd A, with a fixed reference area scale. The force opposes the
 * velocity and is split into axis components by velocity fraction.
 */

#pragma once

#include "ctk/ctk_config.h"

class DragModel {
public:
    /**
     * Drag force magnitude.
     * @param speed_ms    Current speed (m/s, >= 0)
     * @param drag_coeff  Dimensionless drag coefficient
     * @return Force magnitude (N, >= 0)
     */
    static double getForce(double speed_ms, double drag_coeff);

    /**
     * Drag force components opposing the velocity vector.
     * Zero speed produces zero force rather than dividing by the speed.
     * @param vx, vy      Velocity components (m/s)
     * @param drag_coeff  Dimensionless drag coefficient
     * @param out_fx      Output: horizontal force (N), opposes vx
     * @param out_fy      Output: vertical force (N), opposes vy
     */
    static void getForceComponents(double vx, double vy, double drag_coeff,
                                   double& out_fx, double& out_fy);
};
