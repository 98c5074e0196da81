#pragma once

#include <cstdint>

#include "animation/animation_node_id.hpp"

class AnimationStateMachine;

/**
 * Sent whenever a state machine enters or exits one of its nodes
 */
struct AnimationNodeEvent {
    /**
     * The state machine that the node belongs to
     */
    const AnimationStateMachine* state_machine = nullptr;

    NodeId node = 0;

    uint32_t layer_index = 0;
};

/**
 * Something that wants to hear about nodes being entered and exited
 */
class AnimationNodeListener {
public:
    virtual ~AnimationNodeListener() = default;

    virtual void on_node_enter(const AnimationNodeEvent& event) = 0;

    virtual void on_node_exit(const AnimationNodeEvent& event) = 0;
};
