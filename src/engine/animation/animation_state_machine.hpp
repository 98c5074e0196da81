#pragma once

#include <EASTL/optional.h>
#include <EASTL/string.h>
#include <EASTL/string_view.h>
#include <EASTL/unordered_set.h>
#include <EASTL/vector.h>

#include "animation/animation_node_id.hpp"
#include "animation/animation_node_listener.hpp"

/**
 * One layer of a state machine. The layer is always in exactly one of its states once the state machine starts
 */
struct AnimationLayer {
    eastl::string name;

    /**
     * Names of all the states in this layer. The first one is the layer's default state
     */
    eastl::vector<eastl::string> states;
};

/**
 * A minimal animation state machine
 *
 * This doesn't sample any animations, it only tracks which state each layer is in and tells its listeners when
 * states are entered and exited. The real animation graph drives the FX components the same way
 */
class AnimationStateMachine {
public:
    explicit AnimationStateMachine(eastl::vector<AnimationLayer> layers_in);

    /**
     * Adds a listener. The state machine does not own its listeners, remove them before they die
     */
    void add_listener(AnimationNodeListener* listener);

    void remove_listener(AnimationNodeListener* listener);

    /**
     * Enters the default state of every layer
     */
    void start();

    /**
     * Exits the current state of the given layer, then enters the named state
     *
     * Throws std::out_of_range if the layer doesn't exist or doesn't have a state with that name
     */
    void transition_to(uint32_t layer_index, eastl::string_view state_name);

    /**
     * Exits the current state of every layer
     */
    void stop();

    /**
     * Gets the node that the given layer is currently in, or nullopt if the layer hasn't been started
     */
    eastl::optional<NodeId> get_current_node(uint32_t layer_index) const;

    const eastl::vector<AnimationLayer>& get_layers() const;

    eastl::vector<eastl::string> get_node_names() const;

    eastl::unordered_set<NodeId> get_node_ids() const;

private:
    eastl::vector<AnimationLayer> layers;

    eastl::vector<eastl::optional<NodeId>> current_nodes;

    eastl::vector<AnimationNodeListener*> listeners;

    void enter_node(uint32_t layer_index, NodeId node);

    void exit_node(uint32_t layer_index);
};
