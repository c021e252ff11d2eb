/**
 * @file wind.h
 * @brief Horizontal wind load on the projectile in flight.
 *
 * Wind enters the equations of motion as a constant horizontal force rather
 * than through the airspeed used for drag. Positive wind opposes downrange
 * flight. This under-models the wind/drag interaction at high wind speeds.
 */

#pragma once

#include "ctk/ctk_config.h"

class WindCorrection {
public:
    /**
     * Horizontal force applied by wind (N, positive = downrange).
     * @param wind_ms  Signed wind speed, positive = blowing toward the launcher
     */
    static double horizontalForce(double wind_ms);

    /**
     * Clamp a wind value into the engine's accepted domain.
     * @return true if the value was already inside the domain
     */
    static bool clampToDomain(double& wind_ms);
};
