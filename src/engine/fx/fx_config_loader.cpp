#include "fx_config_loader.hpp"

#include <cstdint>

#include <simdjson.h>
#include <spdlog/spdlog.h>
#include <tracy/Tracy.hpp>

#include "core/system_interface.hpp"

static std::shared_ptr<spdlog::logger> logger;

static void init_logger() {
    if(logger == nullptr) {
        logger = SystemInterface::get().get_logger("FxConfigLoader");
    }
}

static std::runtime_error make_error(
    const std::string_view context, const std::string_view key, const simdjson::error_code error
    ) {
    return std::runtime_error{fmt::format("{}: could not read {} ({})", context, key, simdjson::error_message(error))};
}

static float read_float(
    simdjson::ondemand::object& object, const std::string_view key, const float default_value,
    const std::string_view context
    ) {
    double value;
    const auto error = object[key].get_double().get(value);
    if(error == simdjson::NO_SUCH_FIELD) {
        return default_value;
    }
    if(error) {
        throw make_error(context, key, error);
    }

    return static_cast<float>(value);
}

/**
 * Reads a delay, deadline, or duration. Those can't go backwards in time
 */
static float read_duration(simdjson::ondemand::object& object, const std::string_view key, const std::string_view context) {
    const auto value = read_float(object, key, 0, context);
    if(value < 0) {
        throw std::runtime_error{fmt::format("{}: {} may not be negative, but it's {}", context, key, value)};
    }
    return value;
}

static bool read_bool(simdjson::ondemand::object& object, const std::string_view key, const std::string_view context) {
    bool value;
    const auto error = object[key].get_bool().get(value);
    if(error == simdjson::NO_SUCH_FIELD) {
        return false;
    }
    if(error) {
        throw make_error(context, key, error);
    }

    return value;
}

static eastl::optional<eastl::string> read_string(
    simdjson::ondemand::object& object, const std::string_view key, const std::string_view context
    ) {
    std::string_view value;
    const auto error = object[key].get_string().get(value);
    if(error == simdjson::NO_SUCH_FIELD) {
        return eastl::nullopt;
    }
    if(error) {
        throw make_error(context, key, error);
    }

    return eastl::string{value.data(), value.size()};
}

static eastl::optional<ResourcePath> read_resource(
    simdjson::ondemand::object& object, const std::string_view key, const std::string_view context
    ) {
    const auto path = read_string(object, key, context);
    if(!path || path->empty()) {
        return eastl::nullopt;
    }

    return ResourcePath{eastl::string_view{path->data(), path->size()}};
}

static eastl::string read_node_name(simdjson::ondemand::object& object, const std::string_view context) {
    auto name = read_string(object, "node", context);
    if(!name) {
        throw std::runtime_error{fmt::format("{}: every event needs a node name", context)};
    }

    return *name;
}

static fx::NodeEntryEvent read_entry_event(simdjson::ondemand::object& object, const std::string_view context) {
    auto event = fx::NodeEntryEvent{};
    event.node_name = read_node_name(object, context);
    event.node_id = to_node_id(event.node_name);
    event.effect = read_resource(object, "effect", context);
    event.spawn_delay = read_duration(object, "spawn_delay", context);
    event.abort_deadline = read_duration(object, "abort_deadline", context);
    event.sound = read_resource(object, "sound", context);
    event.sound_delay = read_duration(object, "sound_delay", context);
    event.volume = read_float(object, "volume", 1, context);
    event.loop = read_bool(object, "loop", context);
    event.shake_delay = read_duration(object, "shake_delay", context);
    event.shake_duration = read_duration(object, "shake_duration", context);
    event.shake_frequency = read_float(object, "shake_frequency", 0, context);
    event.shake_amplitude = read_float(object, "shake_amplitude", 0, context);

    return event;
}

static fx::NodeExitEvent read_exit_event(simdjson::ondemand::object& object, const std::string_view context) {
    auto event = fx::NodeExitEvent{};
    event.node_name = read_node_name(object, context);
    event.node_id = to_node_id(event.node_name);
    event.effect = read_resource(object, "effect", context);
    event.spawn_delay = read_duration(object, "spawn_delay", context);
    event.sound = read_resource(object, "sound", context);
    event.sound_delay = read_duration(object, "sound_delay", context);
    event.volume = read_float(object, "volume", 1, context);

    return event;
}

/**
 * Reads each object in the array with the given key. A missing array is the same as an empty one
 */
template<typename EventType, typename ReadFunc>
static eastl::vector<EventType> read_events(
    simdjson::ondemand::object& root, const std::string_view key, ReadFunc read_event
    ) {
    auto events = eastl::vector<EventType>{};

    simdjson::ondemand::array array;
    const auto error = root[key].get_array().get(array);
    if(error == simdjson::NO_SUCH_FIELD) {
        return events;
    }
    if(error) {
        throw make_error("FX config", key, error);
    }

    auto index = 0u;
    for(auto element : array) {
        const auto context = fmt::format("{} index {}", key, index);

        simdjson::ondemand::object object;
        if(const auto element_error = element.get_object().get(object)) {
            throw make_error(context, "event", element_error);
        }

        events.emplace_back(read_event(object, context));
        index++;
    }

    return events;
}

static simdjson::ondemand::object iterate_root(
    simdjson::ondemand::parser& parser, simdjson::padded_string& json, simdjson::ondemand::document& document,
    const std::string_view context
    ) {
    if(const auto error = parser.iterate(json).get(document)) {
        throw make_error(context, "document", error);
    }

    simdjson::ondemand::object root;
    if(const auto error = document.get_object().get(root)) {
        throw make_error(context, "root object", error);
    }

    return root;
}

static eastl::optional<eastl::string> load_text(const ResourcePath& file) {
    return SystemInterface::get().load_text_file(file.to_filepath());
}

namespace fx {
    FxTriggerConfig parse_fx_config(const std::string_view json_text) {
        ZoneScoped;

        init_logger();

        auto parser = simdjson::ondemand::parser{};
        auto json = simdjson::padded_string{json_text};
        auto document = simdjson::ondemand::document{};
        auto root = iterate_root(parser, json, document, "FX config");

        auto config = FxTriggerConfig{};
        config.dev_notes = read_string(root, "dev_notes", "FX config").value_or("");

        uint64_t audio_channels;
        const auto channels_error = root["audio_channels"].get_uint64().get(audio_channels);
        if(channels_error == simdjson::SUCCESS) {
            if(audio_channels > UINT32_MAX) {
                throw make_error("FX config", "audio_channels", simdjson::NUMBER_OUT_OF_RANGE);
            }
            config.audio_channels = static_cast<uint32_t>(audio_channels);
        } else if(channels_error != simdjson::NO_SUCH_FIELD) {
            throw make_error("FX config", "audio_channels", channels_error);
        }

        config.on_node_entry = read_events<NodeEntryEvent>(root, "on_node_entry", read_entry_event);
        config.on_node_exit = read_events<NodeExitEvent>(root, "on_node_exit", read_exit_event);

        logger->debug(
            "Parsed FX config with {} entry events and {} exit events",
            config.on_node_entry.size(),
            config.on_node_exit.size());

        return config;
    }

    FxTriggerConfig load_fx_config(const ResourcePath& config_file) {
        init_logger();

        const auto text = load_text(config_file);
        if(!text) {
            throw std::runtime_error{fmt::format("Could not read FX config {}", config_file)};
        }

        logger->info("Loading FX config {}", config_file);
        return parse_fx_config(std::string_view{text->data(), text->size()});
    }

    static eastl::vector<AnimationLayer> read_controller_layers(simdjson::ondemand::object& controller) {
        auto layers = eastl::vector<AnimationLayer>{};

        simdjson::ondemand::array layers_array;
        if(const auto error = controller["layers"].get_array().get(layers_array)) {
            throw make_error("Animator graph", "layers", error);
        }

        for(auto layer_element : layers_array) {
            simdjson::ondemand::object layer_object;
            if(const auto error = layer_element.get_object().get(layer_object)) {
                throw make_error("Animator graph", "layer", error);
            }

            auto& layer = layers.emplace_back();
            layer.name = read_string(layer_object, "name", "Animator graph layer").value_or("");

            simdjson::ondemand::array states_array;
            if(const auto error = layer_object["states"].get_array().get(states_array)) {
                throw make_error("Animator graph layer", "states", error);
            }
            for(auto state_element : states_array) {
                std::string_view state_name;
                if(const auto error = state_element.get_string().get(state_name)) {
                    throw make_error("Animator graph layer", "state", error);
                }
                layer.states.emplace_back(state_name.data(), state_name.size());
            }
        }

        return layers;
    }

    static eastl::string read_graph_type(simdjson::ondemand::object& graph) {
        auto type = read_string(graph, "type", "Animator graph");
        if(!type) {
            throw UnrecognizedGraphTypeError{"Animator graph has no type"};
        }
        return *type;
    }

    eastl::vector<AnimationLayer> parse_animator_graph(const std::string_view json_text) {
        ZoneScoped;

        init_logger();

        auto parser = simdjson::ondemand::parser{};
        auto json = simdjson::padded_string{json_text};
        auto document = simdjson::ondemand::document{};
        auto root = iterate_root(parser, json, document, "Animator graph");

        const auto type = read_graph_type(root);
        if(type == "controller") {
            return read_controller_layers(root);
        }

        if(type == "override_controller") {
            // Override controllers can't be nested, so the thing it's overriding has to be a real controller
            simdjson::ondemand::object base;
            if(const auto error = root["base"].get_object().get(base)) {
                throw make_error("Animator override controller", "base", error);
            }

            const auto base_type = read_graph_type(base);
            if(base_type == "controller") {
                return read_controller_layers(base);
            }

            throw UnrecognizedGraphTypeError{
                fmt::format("Override controller wraps an unrecognized graph type {}", base_type.c_str())
            };
        }

        // It's neither of the representations we know about, so we can't tell which nodes it has
        throw UnrecognizedGraphTypeError{fmt::format("Unrecognized animator graph type {}", type.c_str())};
    }

    eastl::vector<AnimationLayer> load_animator_graph(const ResourcePath& graph_file) {
        init_logger();

        const auto text = load_text(graph_file);
        if(!text) {
            throw std::runtime_error{fmt::format("Could not read animator graph {}", graph_file)};
        }

        logger->info("Loading animator graph {}", graph_file);
        return parse_animator_graph(std::string_view{text->data(), text->size()});
    }
} // fx
