#include "fx_config_validator.hpp"

#include <EASTL/map.h>
#include <EASTL/unordered_map.h>
#include <spdlog/spdlog.h>

#include "core/system_interface.hpp"

static std::shared_ptr<spdlog::logger> logger;

/**
 * Finds events that refer to the same node. Each pair of events is its own error
 */
template<typename EventType>
static void find_duplicate_events(
    const eastl::vector<EventType>& events, const char* list_name, eastl::vector<eastl::string>& errors
    ) {
    for(auto i = 0u; i < events.size(); i++) {
        if(events[i].node_name.empty()) {
            continue;
        }
        for(auto j = i + 1; j < events.size(); j++) {
            if(events[i].node_id == events[j].node_id) {
                errors.emplace_back(
                    eastl::string::CtorSprintf{},
                    "Entries %u and %u in %s refer to the same node name (%s)! This is probably a copy-paste error",
                    i,
                    j,
                    list_name,
                    events[i].node_name.c_str());
            }
        }
    }
}

namespace fx {
    ValidationReport validate_fx_config(
        const FxTriggerConfig& config, const eastl::vector<eastl::string>& graph_node_names
        ) {
        if(logger == nullptr) {
            logger = SystemInterface::get().get_logger("FxConfigValidator");
        }

        auto report = ValidationReport{};

        if(config.audio_channels == 0) {
            report.warnings.emplace_back("No audio channels connected! Sounds will not play");
        }

        find_duplicate_events(config.on_node_entry, "on_node_entry", report.errors);
        find_duplicate_events(config.on_node_exit, "on_node_exit", report.errors);

        // Node IDs are hashes. If two of the graph's nodes hash to the same ID we can't tell their events apart
        auto graph_nodes = eastl::unordered_map<NodeId, eastl::string>{};
        for(const auto& name : graph_node_names) {
            const auto [itr, inserted] = graph_nodes.emplace(to_node_id(name), name);
            if(!inserted && itr->second != name) {
                report.errors.emplace_back(
                    eastl::string::CtorSprintf{},
                    "Animation nodes %s and %s have the same hash, events for them can't be told apart",
                    itr->second.c_str(),
                    name.c_str());
            }
        }

        // Map from node ID to useful debugging information, which we show if the node doesn't exist
        auto used_names = eastl::map<NodeId, eastl::string>{};
        for(auto i = 0u; i < config.on_node_entry.size(); i++) {
            const auto& event = config.on_node_entry[i];
            used_names[event.node_id] = eastl::string{
                eastl::string::CtorSprintf{}, "%s (on_node_entry index %u)", event.node_name.c_str(), i
            };
        }
        for(auto i = 0u; i < config.on_node_exit.size(); i++) {
            const auto& event = config.on_node_exit[i];
            used_names[event.node_id] = eastl::string{
                eastl::string::CtorSprintf{}, "%s (on_node_exit index %u)", event.node_name.c_str(), i
            };
        }

        report.num_referenced_names = used_names.size();

        // Anything that isn't in the graph isn't actually valid
        for(const auto& [node_id, description] : used_names) {
            if(graph_nodes.find(node_id) == graph_nodes.end()) {
                report.errors.emplace_back(eastl::string{"Could not find animation node named "} + description);
            }
        }

        for(const auto& warning : report.warnings) {
            logger->warn("{}", warning.c_str());
        }
        for(const auto& error : report.errors) {
            logger->error("{}", error.c_str());
        }

        return report;
    }

    ValidationReport validate_fx_config(
        const FxTriggerConfig& config, const eastl::vector<AnimationLayer>& graph_layers
        ) {
        auto names = eastl::vector<eastl::string>{};
        for(const auto& layer : graph_layers) {
            names.insert(names.end(), layer.states.begin(), layer.states.end());
        }

        return validate_fx_config(config, names);
    }
} // fx
