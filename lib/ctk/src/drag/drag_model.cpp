/**
 * @file drag_model.cpp
 * @brief Quadratic drag implementation.
 */

#include "drag_model.h"
#include <cmath>

double DragModel::getForce(double speed_ms, double drag_coeff) {
    return 0.5 * CTK_AIR_DENSITY * speed_ms * speed_ms * drag_coeff * CTK_DRAG_AREA_SCALE;
}

void DragModel::getForceComponents(double vx, double vy, double drag_coeff,
                                   double& out_fx, double& out_fy) {
    const double speed = std::sqrt(vx * vx + vy * vy);
    if (!(speed > 0.0)) {
        out_fx = 0.0;
        out_fy = 0.0;
        return;
    }

    const double force = getForce(speed, drag_coeff);
    out_fx = -force * (vx / speed);
    out_fy = -force * (vy / speed);
}
