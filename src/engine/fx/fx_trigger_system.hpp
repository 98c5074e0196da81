#pragma once

#include <entt/entity/handle.hpp>
#include <entt/entity/registry.hpp>

#include "fx/animator_triggered_fx.hpp"
#include "fx/fx_event_config.hpp"

class AnimationStateMachine;

/**
 * Ticks the FX triggers of every character in the registry
 */
class FxTriggerSystem {
public:
    /**
     * @param poll_interval How often FX tasks check on their nodes, in seconds. Usually the fixed timestep
     */
    FxTriggerSystem(entt::registry& registry_in, float poll_interval_in);

    ~FxTriggerSystem();

    FxTriggerSystem(const FxTriggerSystem& other) = delete;

    FxTriggerSystem& operator=(const FxTriggerSystem& other) = delete;

    /**
     * Creates a new FX trigger on the character and hooks it up to the state machine
     *
     * The character's entity becomes the anchor for the trigger's effects. A character can only listen to one state
     * machine, adding a trigger for a different state machine throws std::runtime_error
     */
    fx::AnimatorTriggeredFx& add_fx_trigger(
        entt::handle character, AnimationStateMachine& state_machine, fx::FxTriggerConfig config,
        fx::FxCollaborators collaborators
        );

    void tick(float delta_time);

    /**
     * Counts the tasks that are still running across all characters
     */
    size_t num_running_tasks() const;

private:
    entt::registry& registry;

    float poll_interval;

    void on_fx_trigger_destroyed(entt::registry& registry, entt::entity entity);
};
