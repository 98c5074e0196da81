#pragma once

#include <cstdio>
#include <filesystem>
#include <memory>
#include <string>

#include <EASTL/optional.h>
#include <EASTL/string.h>
#include <spdlog/logger.h>

/**
 * Interface to the system
 *
 * Owns the loggers and knows where the data folder lives. Every other subsystem gets its logger from here
 */
class SystemInterface {
public:
    static void initialize(const std::filesystem::path& exe_folder);

    static SystemInterface& get();

    explicit SystemInterface(std::filesystem::path exe_folder);

    /**
     * Gets a system logger with the specified name
     *
     * The logger prints to stdout and to the log file. Asking for the same name twice returns the same logger
     */
    std::shared_ptr<spdlog::logger> get_logger(const std::string& name);

    void flush_all_loggers();

    /**
     * Sets the level of every logger we've handed out, and of every logger we'll hand out in the future
     */
    void set_log_level(spdlog::level::level_enum level);

    /**
     * Changes the file that loggers created after this call write to. Existing loggers keep their file
     */
    void set_log_file(const std::filesystem::path& log_file_in);

    std::filesystem::path get_working_directory() const;

    /**
     * Gets the folder where game data lives. Usually exe_dir / data
     */
    std::filesystem::path get_data_folder() const;

    /**
     * Reads a text file in its entirety
     *
     * This method returns an empty optional if the file can't be read. It returns an empty string if the file can
     * be read but just happens to have no data
     */
    eastl::optional<eastl::string> load_text_file(const std::filesystem::path& filepath);

    FILE* open_file(const std::filesystem::path& filepath);

private:
    std::shared_ptr<spdlog::logger> logger;

    std::filesystem::path exe_folder;

    std::filesystem::path log_file = "animfx.log";

    spdlog::level::level_enum log_level;
};
