/**
 * @file launcher_preset.cpp
 * @brief JSON launcher preset loading.
 */

#include "launcher_preset.h"
#include "ctk/ctk_config.h"
#include "nlohmann/json.hpp"
#include "../lib/ctk/src/corrections/wind.h"
#include <cmath>
#include <fstream>
#include <istream>

using json = nlohmann::json;

namespace {

// Structural limits for hand-edited presets
constexpr double kArmLengthMin  = 0.5;
constexpr double kArmLengthMax  = 20.0;
constexpr double kArmMassMax    = 500.0;
constexpr double kProjMassMin   = 0.1;
constexpr double kProjMassMax   = 200.0;
constexpr double kDragCoeffMax  = 2.0;
constexpr double kTargetMin     = 1.0;

double clampField(double value, double lo, double hi, double fallback, bool& changed) {
    if (!std::isfinite(value)) {
        changed = true;
        return fallback;
    }
    if (value < lo) {
        changed = true;
        return lo;
    }
    if (value > hi) {
        changed = true;
        return hi;
    }
    return value;
}

double readNumber(const json& j, const char* key, double fallback) {
    if (j.contains(key) && j[key].is_number()) {
        return j[key].get<double>();
    }
    return fallback;
}

} // namespace

LauncherSpec DefaultLauncherSpec() {
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

bool SanitizeLauncherSpec(LauncherSpec& spec) {
    bool changed = false;
    spec.stiffness = clampField(spec.stiffness, CTK_STIFFNESS_MIN, CTK_STIFFNESS_MAX,
                                CTK_DEFAULT_STIFFNESS, changed);
    spec.arm_length_m = clampField(spec.arm_length_m, kArmLengthMin, kArmLengthMax,
                                   CTK_DEFAULT_ARM_LENGTH_M, changed);
    spec.arm_mass_kg = clampField(spec.arm_mass_kg, 0.0, kArmMassMax,
                                  CTK_DEFAULT_ARM_MASS_KG, changed);
    spec.proj_mass_kg = clampField(spec.proj_mass_kg, kProjMassMin, kProjMassMax,
                                   CTK_DEFAULT_PROJ_MASS_KG, changed);
    spec.angle_deg = clampField(spec.angle_deg, CTK_ANGLE_MIN_DEG, CTK_ANGLE_MAX_DEG,
                                CTK_DEFAULT_ANGLE_DEG, changed);
    spec.target_range_m = clampField(spec.target_range_m, kTargetMin, 1.0e6,
                                     CTK_DEFAULT_TARGET_M, changed);
    spec.drag_coeff = clampField(spec.drag_coeff, 0.0, kDragCoeffMax,
                                 CTK_DEFAULT_DRAG_COEFF, changed);

    if (!std::isfinite(spec.wind_ms)) {
        spec.wind_ms = CTK_DEFAULT_WIND_MS;
        changed = true;
    } else if (!WindCorrection::clampToDomain(spec.wind_ms)) {
        changed = true;
    }
    return !changed;
}

bool LoadLauncherPreset(std::istream& in, LauncherSpec& out_spec, std::string& out_error) {
    try {
        json j;
        in >> j;

        if (!j.is_object()) {
            out_error = "Preset load failed: top level is not an object";
            return false;
        }

        LauncherSpec spec = DefaultLauncherSpec();
        // "tension" is accepted as an older name for stiffness
        if (j.contains("tension") && j["tension"].is_number()) {
            spec.stiffness = j["tension"].get<double>();
        }
        spec.stiffness = readNumber(j, "stiffness", spec.stiffness);
        spec.arm_length_m = readNumber(j, "arm_length_m", spec.arm_length_m);
        spec.arm_mass_kg = readNumber(j, "arm_mass_kg", spec.arm_mass_kg);
        spec.proj_mass_kg = readNumber(j, "proj_mass_kg", spec.proj_mass_kg);
        spec.angle_deg = readNumber(j, "angle_deg", spec.angle_deg);
        spec.target_range_m = readNumber(j, "target_range_m", spec.target_range_m);
        spec.wind_ms = readNumber(j, "wind_ms", spec.wind_ms);
        spec.drag_coeff = readNumber(j, "drag_coeff", spec.drag_coeff);

        SanitizeLauncherSpec(spec);
        out_spec = spec;
        return true;
    } catch (const json::exception& e) {
        out_error = "Preset load failed: JSON error: ";
        out_error += e.what();
        return false;
    }
}

bool LoadLauncherPresetFile(const std::string& path, LauncherSpec& out_spec, std::string& out_error) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        out_error = "Preset load failed: cannot open " + path;
        return false;
    }
    return LoadLauncherPreset(in, out_spec, out_error);
}

std::string SerializeLauncherPreset(const LauncherSpec& spec) {
    json j;
    j["stiffness"] = spec.stiffness;
    j["arm_length_m"] = spec.arm_length_m;
    j["arm_mass_kg"] = spec.arm_mass_kg;
    j["proj_mass_kg"] = spec.proj_mass_kg;
    j["angle_deg"] = spec.angle_deg;
    j["target_range_m"] = spec.target_range_m;
    j["wind_ms"] = spec.wind_ms;
    j["drag_coeff"] = spec.drag_coeff;
    return j.dump(2);
}
