/*
 * Checks an FX trigger config against the animator graph it's meant for
 *
 * Usage: fx_lint <fx_config.json> <animator_graph.json>
 *
 * Exits with 0 if the config is fine, 1 if it has errors, and 2 if the files couldn't be read at all
 */

#include <cstdlib>
#include <filesystem>

#include <spdlog/spdlog.h>

#include "core/system_interface.hpp"
#include "fx/fx_config_loader.hpp"
#include "fx/fx_config_validator.hpp"

static constexpr auto EXIT_VALIDATION_FAILED = 1;
static constexpr auto EXIT_BAD_INPUT = 2;

int main(const int argc, const char** argv) {
    const auto exe_path = std::filesystem::path{argv[0]};
    SystemInterface::initialize(exe_path.parent_path());
    // The linter's whole job is to report, so don't hide its summary in release builds
    SystemInterface::get().set_log_level(spdlog::level::info);

    auto logger = SystemInterface::get().get_logger("fx_lint");

    if(argc != 3) {
        logger->error("Usage: {} <fx_config.json> <animator_graph.json>", exe_path.filename().string());
        return EXIT_BAD_INPUT;
    }

    auto report = fx::ValidationReport{};
    try {
        const auto config = fx::load_fx_config(ResourcePath{std::string_view{argv[1]}});
        const auto layers = fx::load_animator_graph(ResourcePath{std::string_view{argv[2]}});
        report = fx::validate_fx_config(config, layers);
    } catch(const fx::UnrecognizedGraphTypeError& e) {
        logger->critical("Can't validate against this animator graph: {}", e.what());
        SystemInterface::get().flush_all_loggers();
        return EXIT_BAD_INPUT;
    } catch(const std::exception& e) {
        logger->error("Could not load inputs: {}", e.what());
        SystemInterface::get().flush_all_loggers();
        return EXIT_BAD_INPUT;
    }

    auto result = EXIT_SUCCESS;
    if(report.succeeded()) {
        logger->info(
            "All {} referenced node names were found in the animator graph. No errors found!",
            report.num_referenced_names);
    } else {
        logger->error("Found {} errors. See the log above for more information", report.errors.size());
        result = EXIT_VALIDATION_FAILED;
    }

    SystemInterface::get().flush_all_loggers();

    return result;
}
