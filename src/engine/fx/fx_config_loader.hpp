#pragma once

#include <stdexcept>
#include <string_view>

#include <EASTL/vector.h>

#include "animation/animation_state_machine.hpp"
#include "fx/fx_event_config.hpp"
#include "resources/resource_path.hpp"

namespace fx {
    /**
     * Thrown when an animator graph description is of a type we don't know how to read. We can't tell which nodes
     * exist in a graph like that, so nothing that depends on the graph can be trusted
     */
    class UnrecognizedGraphTypeError : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    /**
     * Parses an FX trigger config from JSON, resolving every node name to its NodeId
     *
     * Throws std::runtime_error if the JSON is malformed, an event has no node name, or a delay is negative
     */
    FxTriggerConfig parse_fx_config(std::string_view json_text);

    FxTriggerConfig load_fx_config(const ResourcePath& config_file);

    /**
     * Parses the description of an animator graph
     *
     * Graphs are either a "controller" with layers of states, or an "override_controller" that wraps a controller.
     * Override controllers can't be nested. Anything else throws UnrecognizedGraphTypeError, other problems with the
     * JSON throw std::runtime_error
     */
    eastl::vector<AnimationLayer> parse_animator_graph(std::string_view json_text);

    eastl::vector<AnimationLayer> load_animator_graph(const ResourcePath& graph_file);
} // fx
