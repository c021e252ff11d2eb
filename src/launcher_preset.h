/**
 * @file launcher_preset.h
 * @brief JSON launcher presets for the console harness.
 *
 * Missing keys keep their default values; loaded values are sanitized into
 * the engine's accepted domain so a malformed file cannot fault the engine.
 */

#pragma once

#include "ctk/ctk_types.h"
#include <iosfwd>
#include <string>

LauncherSpec DefaultLauncherSpec();

/**
 * Clamp every field of a spec into the accepted input domain.
 * @return true if nothing had to change
 */
bool SanitizeLauncherSpec(LauncherSpec& spec);

/**
 * Parse a preset. On failure out_spec is left untouched and out_error holds
 * a message.
 */
bool LoadLauncherPreset(std::istream& in, LauncherSpec& out_spec, std::string& out_error);
bool LoadLauncherPresetFile(const std::string& path, LauncherSpec& out_spec, std::string& out_error);

/**
 * Serialize a spec to preset JSON (two-space indent).
 */
std::string SerializeLauncherPreset(const LauncherSpec& spec);
