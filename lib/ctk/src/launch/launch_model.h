/**
 * @file launch_model.h
 * @brief Closed-form release state of the throwing arm.
 *
 * Energy stored in the drive spring over the fixed swing arc, less mechanical
 * losses, spins up the arm plus projectile about the pivot. The release speed
 * is the tangential speed at the arm tip. No swing phase is integrated, so the
 * result carries no timestep error.
 */

#pragma once

#include "ctk/ctk_config.h"
#include "ctk/ctk_types.h"

class LaunchModel {
public:
    /**
     * Derive the projectile release state for a launcher spec.
     * Pure function of its input. An arm with non-positive inertia yields a
     * zero-velocity release at the arm tip.
     */
    static ReleaseState deriveRelease(const LauncherSpec& spec);

    /**
     * Rotational inertia about the pivot: uniform rod about one end plus the
     * projectile as a point mass at the tip.
     */
    static double rotationalInertia(double arm_length_m, double arm_mass_kg,
                                    double proj_mass_kg);

    // E = ½ k θ² over the fixed swing arc
    static double storedEnergy(double stiffness);

    // Tip speed after the usable fraction of stored energy reaches the arm
    static double releaseSpeed(const LauncherSpec& spec);

    /**
     * Check a spec against the kernel's input domain.
     * @return CTK_Fault bitfield, CTK_Fault::NONE if well-formed
     */
    static uint32_t validate(const LauncherSpec& spec);
};
