/**
 * @file launch_model.cpp
 * @brief Launch model implementation.
 *
 * Coordinate system:
 *   X = downrange (pivot at x = 0)
 *   Y = vertical (up positive, ground at y = 0)
 */

#include "launch_model.h"
#include <cmath>

double LaunchModel::rotationalInertia(double arm_length_m, double arm_mass_kg,
                                      double proj_mass_kg) {
    const double l2 = arm_length_m * arm_length_m;
    return (arm_mass_kg * l2) / 3.0 + proj_mass_kg * l2;
}

double LaunchModel::storedEnergy(double stiffness) {
    return 0.5 * stiffness * CTK_SWING_ARC_RAD * CTK_SWING_ARC_RAD;
}

double LaunchModel::releaseSpeed(const LauncherSpec& spec) {
    const double inertia = rotationalInertia(spec.arm_length_m, spec.arm_mass_kg,
                                             spec.proj_mass_kg);
    const double usable_energy = storedEnergy(spec.stiffness) * CTK_MECHANICAL_EFFICIENCY;

    if (!(inertia > 0.0) || !(usable_energy > 0.0)) {
        return 0.0;
    }

    // KE = ½ I ω²
    const double omega = std::sqrt((2.0 * usable_energy) / inertia);
    return omega * spec.arm_length_m;
}

ReleaseState LaunchModel::deriveRelease(const LauncherSpec& spec) {
    const double launch_rad  = spec.angle_deg * CTK_DEG_TO_RAD;
    const double release_rad = (spec.angle_deg + CTK_RELEASE_ARM_OFFSET_DEG) * CTK_DEG_TO_RAD;
    const double speed = releaseSpeed(spec);

    ReleaseState rs;
    rs.vx_ms = std::cos(launch_rad) * speed;
    rs.vy_ms = std::sin(launch_rad) * speed;

    // Arm tip on the arm-length circle around the pivot
    rs.x_m = std::cos(release_rad) * spec.arm_length_m;
    rs.y_m = CTK_PIVOT_HEIGHT_M + std::sin(release_rad) * spec.arm_length_m;
    return rs;
}

uint32_t LaunchModel::validate(const LauncherSpec& spec) {
    uint32_t faults = CTK_Fault::NONE;

    const double fields[] = {spec.stiffness, spec.arm_length_m, spec.arm_mass_kg,
                             spec.proj_mass_kg, spec.angle_deg, spec.target_range_m,
                             spec.wind_ms, spec.drag_coeff};
    for (double v : fields) {
        if (!std::isfinite(v)) {
            faults |= CTK_Fault::NON_FINITE;
            break;
        }
    }

    if (!(spec.arm_length_m > 0.0))   faults |= CTK_Fault::BAD_ARM_LENGTH;
    if (!(spec.proj_mass_kg > 0.0))   faults |= CTK_Fault::BAD_PROJ_MASS;
    if (!(spec.arm_mass_kg >= 0.0))   faults |= CTK_Fault::BAD_ARM_MASS;
    if (!(spec.drag_coeff >= 0.0))    faults |= CTK_Fault::BAD_DRAG;
    if (!(spec.stiffness > 0.0))      faults |= CTK_Fault::BAD_STIFFNESS;
    if (!(spec.target_range_m > 0.0)) faults |= CTK_Fault::BAD_TARGET;

    return faults;
}
