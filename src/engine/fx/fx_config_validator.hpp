#pragma once

#include <EASTL/string.h>
#include <EASTL/vector.h>

#include "animation/animation_state_machine.hpp"
#include "fx/fx_event_config.hpp"

namespace fx {
    struct ValidationReport {
        /**
         * Problems that make the config wrong. Each one is a full sentence that can be shown to an artist
         */
        eastl::vector<eastl::string> errors;

        /**
         * Things that look suspicious, but don't fail validation
         */
        eastl::vector<eastl::string> warnings;

        /**
         * How many different node names the config refers to
         */
        size_t num_referenced_names = 0;

        bool succeeded() const {
            return errors.empty();
        }
    };

    /**
     * Makes sure that all the node names an FX config refers to are actually in the animator graph, and that no
     * node has two events of the same kind
     *
     * This is a design-time check. The runtime happily accepts broken configs: it uses the first matching event and
     * ignores events for nodes that never get entered
     *
     * @param graph_node_names Names of every state in every layer of the graph
     */
    ValidationReport validate_fx_config(
        const FxTriggerConfig& config, const eastl::vector<eastl::string>& graph_node_names
        );

    ValidationReport validate_fx_config(
        const FxTriggerConfig& config, const eastl::vector<AnimationLayer>& graph_layers
        );
} // fx
