#include "fx_settings.hpp"

#include <spdlog/spdlog.h>
#include <toml.hpp>

#include "core/system_interface.hpp"

static constexpr auto DEFAULT_SETTINGS_FILE_NAME = "config/fx.toml";

static std::shared_ptr<spdlog::logger> logger;

static void init_logger() {
    if(logger == nullptr) {
        logger = SystemInterface::get().get_logger("FxSettings");
    }
}

static FxSettings from_toml(const toml::value& data) {
    auto settings = FxSettings{};

    const auto fixed_timestep = toml::find_or<double>(
        data,
        "timing",
        "fixed_timestep",
        static_cast<double>(settings.fixed_timestep));
    if(fixed_timestep > 0) {
        settings.fixed_timestep = static_cast<float>(fixed_timestep);
    } else {
        logger->warn("fixed_timestep must be positive, using {}", settings.fixed_timestep);
    }

    const auto level_name = toml::find_or<std::string>(data, "logging", "level", std::string{});
    if(!level_name.empty()) {
        const auto level = spdlog::level::from_str(level_name);
        if(level != spdlog::level::off || level_name == "off") {
            settings.log_level = level;
        } else {
            logger->warn("Unknown log level {}", level_name);
        }
    }

    const auto log_file = toml::find_or<std::string>(data, "logging", "file", std::string{});
    if(!log_file.empty()) {
        settings.log_file = log_file;
    }

    return settings;
}

FxSettings FxSettings::load(const std::filesystem::path& settings_file) {
    init_logger();

    const auto path = settings_file.empty()
                          ? SystemInterface::get().get_data_folder() / DEFAULT_SETTINGS_FILE_NAME
                          : settings_file;
    if(!std::filesystem::exists(path)) {
        logger->info("No settings file at {}, using the defaults", path.string());
        return FxSettings{};
    }

    try {
        return from_toml(toml::parse(path));
    } catch(const std::exception& e) {
        logger->error(e.what());
        return FxSettings{};
    }
}

FxSettings FxSettings::parse(const std::string& toml_text) {
    init_logger();

    try {
        return from_toml(toml::parse_str(toml_text));
    } catch(const std::exception& e) {
        logger->error(e.what());
        return FxSettings{};
    }
}

void FxSettings::apply() const {
    auto& system_interface = SystemInterface::get();
    system_interface.set_log_file(log_file);
    system_interface.set_log_level(log_level);
}
