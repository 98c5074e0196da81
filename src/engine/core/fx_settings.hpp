#pragma once

#include <filesystem>
#include <string>

#include <spdlog/common.h>

/**
 * Runtime settings for the FX system
 *
 * Read from a TOML file that looks like this:
 *
 * [timing]
 * fixed_timestep = 0.02
 *
 * [logging]
 * level = "debug"
 * file = "animfx.log"
 */
struct FxSettings {
    /**
     * Loads the settings file. Missing files, missing keys, and broken files all leave the defaults in place
     *
     * An empty path loads data/config/fx.toml from the data folder
     */
    static FxSettings load(const std::filesystem::path& settings_file);

    static FxSettings parse(const std::string& toml_text);

    /**
     * How often FX tasks check whether their node is still active, in seconds
     */
    float fixed_timestep = 0.02f;

#ifndef NDEBUG
    spdlog::level::level_enum log_level = spdlog::level::debug;
#else
    spdlog::level::level_enum log_level = spdlog::level::warn;
#endif

    std::filesystem::path log_file = "animfx.log";

    /**
     * Sends the logging settings to the system interface
     */
    void apply() const;
};
