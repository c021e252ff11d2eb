/**
 * @file wind.cpp
 * @brief Wind load implementation.
 */

#include "wind.h"

double WindCorrection::horizontalForce(double wind_ms) {
    // One newton per m/s of wind, applied against downrange travel
    return -wind_ms;
}

bool WindCorrection::clampToDomain(double& wind_ms) {
    if (wind_ms < CTK_WIND_MIN_MS) {
        wind_ms = CTK_WIND_MIN_MS;
        return false;
    }
    if (wind_ms > CTK_WIND_MAX_MS) {
        wind_ms = CTK_WIND_MAX_MS;
        return false;
    }
    return true;
}
