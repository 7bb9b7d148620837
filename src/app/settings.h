/**
 * @file settings.h
 * @brief Startup settings for the console game
 *
 * This file defines the Settings structure and SettingsManager class
 * for reading optional startup configuration from a small JSON file.
 */

#pragma once
#include <cstdint>
#include <string>
#include "core/field_config.h"

/**
 * @brief Startup settings
 *
 * Every field has a default, so a missing or partial file is fine.
 */
struct Settings {
    int fps = 30;              ///< Initial frame rate (snapped to 15/30/60/120)
    int sound = 0;             ///< 1 = sound alerts on at startup
    std::uint64_t seed = 0;    ///< Random seed, 0 = derive from the clock
    FieldConfig field;         ///< Field geometry (validated separately)
};

/**
 * @brief Reads Settings from disk
 *
 * Uses a minimal integer extractor rather than a full JSON parser:
 * it looks for "key" then ':' then an integer.
 */
class SettingsManager {
public:
    SettingsManager() = default;

    /**
     * @brief Load settings from a JSON file
     *
     * If the file doesn't exist or a key cannot be parsed, the default
     * for that key is kept. Rate and sound are clamped; field geometry is
     * left for validate_field_config().
     *
     * @param path Path to the settings file
     * @param found Set to true when the file could be opened
     * @return Settings with loaded or default values
     */
    Settings load(const std::string &path, bool *found = nullptr);

    /**
     * @brief Parse settings from file contents
     */
    Settings parse(const std::string &raw);
};
