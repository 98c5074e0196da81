#include "core/system_interface.hpp"

#include <cerrno>
#include <cstring>

#include <EASTL/vector.h>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

static SystemInterface* instance;

static eastl::vector<std::shared_ptr<spdlog::logger>> all_loggers{};

/**
 * Shared by all loggers, so that each new logger doesn't truncate the file
 */
static spdlog::sink_ptr file_sink;

void SystemInterface::initialize(const std::filesystem::path& exe_folder) {
    if(instance == nullptr) {
        instance = new SystemInterface{exe_folder};
    }
}

SystemInterface& SystemInterface::get() {
    return *instance;
}

SystemInterface::SystemInterface(std::filesystem::path exe_folder_in) :
    exe_folder{std::move(exe_folder_in)} {
#ifndef NDEBUG
    log_level = spdlog::level::debug;
#else
    log_level = spdlog::level::warn;
#endif

    logger = get_logger("SystemInterface");
}

std::shared_ptr<spdlog::logger> SystemInterface::get_logger(const std::string& name) {
    if(auto existing_logger = spdlog::get(name)) {
        return existing_logger;
    }

    if(file_sink == nullptr) {
        file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file.string(), true);
    }

    auto sinks = eastl::vector<spdlog::sink_ptr>{
        std::make_shared<spdlog::sinks::stdout_color_sink_mt>(),
        file_sink,
    };
    sinks[0]->set_pattern("[%n] [%^%l%$] %v");
    auto new_logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());

    new_logger->set_level(log_level);

    // Register the logger so we can access it later if needed
    spdlog::register_logger(new_logger);
    all_loggers.emplace_back(new_logger);

    return new_logger;
}

void SystemInterface::flush_all_loggers() {
    for(auto& log : all_loggers) {
        log->flush();
    }
}

void SystemInterface::set_log_level(const spdlog::level::level_enum level) {
    log_level = level;
    for(auto& log : all_loggers) {
        log->set_level(level);
    }
}

void SystemInterface::set_log_file(const std::filesystem::path& log_file_in) {
    if(log_file_in != log_file) {
        log_file = log_file_in;
        file_sink = nullptr;
    }
}

std::filesystem::path SystemInterface::get_working_directory() const {
    return std::filesystem::current_path();
}

std::filesystem::path SystemInterface::get_data_folder() const {
    return exe_folder / "data";
}

eastl::optional<eastl::string> SystemInterface::load_text_file(const std::filesystem::path& filepath) {
    auto* file = open_file(filepath);
    if(!file) {
        return eastl::nullopt;
    }

    fseek(file, 0, SEEK_END);
    const auto file_size = ftell(file);
    if(file_size < 0) {
        logger->error("Could not get the size of {}: {}", filepath.string(), strerror(errno));
        fclose(file);
        return eastl::nullopt;
    }
    rewind(file);

    auto file_data = eastl::string(static_cast<size_t>(file_size), '\0');
    const auto num_read = fread(file_data.data(), 1, file_data.size(), file);
    fclose(file);

    if(num_read != file_data.size()) {
        logger->error("Could only read {} of {} bytes from {}", num_read, file_data.size(), filepath.string());
        return eastl::nullopt;
    }

    return file_data;
}

FILE* SystemInterface::open_file(const std::filesystem::path& filepath) {
    const auto path_string = filepath.string();
    // fopen happily opens directories on some platforms
    if(std::filesystem::is_directory(filepath)) {
        logger->error("Could not open file {}: it's a directory", path_string);
        return nullptr;
    }

    FILE* file = fopen(path_string.c_str(), "rb");
    if(file == nullptr) {
        logger->error("Could not open file {}: {}", path_string, strerror(errno));
    }

    return file;
}
