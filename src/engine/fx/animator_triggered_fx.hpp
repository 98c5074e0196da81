#pragma once

#include <EASTL/string.h>
#include <entt/entity/handle.hpp>

#include "animation/animation_node_listener.hpp"
#include "audio/audio_channel_pool.hpp"
#include "camera/camera_shaker.hpp"
#include "fx/effect_spawner.hpp"
#include "fx/fx_event_config.hpp"
#include "fx/fx_task.hpp"
#include "fx/node_residency_set.hpp"

class AnimationStateMachine;

namespace fx {
    /**
     * Everything outside of the FX system that AnimatorTriggeredFx talks to
     */
    struct FxCollaborators {
        /**
         * The state machine we listen to. Events from any other state machine are rejected
         */
        const AnimationStateMachine* state_machine = nullptr;

        /**
         * The character's root entity. Effects are parented to it
         */
        entt::handle anchor = {};

        EffectSpawner* effect_spawner = nullptr;

        /**
         * The character's audio channels. May be shared with the character's other FX components
         */
        const audio::ChannelPool* audio_channels = nullptr;

        CameraShaker* camera = nullptr;
    };

    /**
     * Instantiates and maintains visual effects, sound effects, and camera shakes. They're triggered by entering
     * (or exiting) specific nodes in the character's animation state machine
     *
     * A character may have any number of these, each with its own config. They all watch the same state machine
     * independently of each other
     */
    class AnimatorTriggeredFx final : public AnimationNodeListener {
    public:
        /**
         * Throws std::runtime_error if any of the collaborators are missing
         *
         * @param poll_interval How often tasks check whether their node is still active, in seconds
         */
        AnimatorTriggeredFx(FxTriggerConfig config_in, const FxCollaborators& collaborators_in, float poll_interval);

        AnimatorTriggeredFx(const AnimatorTriggeredFx& other) = delete;

        AnimatorTriggeredFx& operator=(const AnimatorTriggeredFx& other) = delete;

        void on_node_enter(const AnimationNodeEvent& event) override;

        void on_node_exit(const AnimationNodeEvent& event) override;

        /**
         * Advances all the timed tasks. Call this once a frame
         */
        void tick(float delta_time);

        /**
         * Drops all pending tasks and forgets which nodes are active. Looping sounds are stopped, effects and shakes
         * that already started play out
         */
        void reset();

        bool is_node_active(NodeId node) const;

        size_t num_running_tasks() const;

        const FxTriggerConfig& get_config() const;

    private:
        const FxTriggerConfig config;

        FxCollaborators collaborators;

        float poll_interval;

        NodeResidencySet active_nodes;

        FxTaskQueue tasks;

        void check_state_machine(const AnimationNodeEvent& event) const;
    };
} // fx
