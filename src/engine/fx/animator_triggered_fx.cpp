#include "animator_triggered_fx.hpp"

#include <stdexcept>

#include <EASTL/algorithm.h>
#include <spdlog/spdlog.h>
#include <tracy/Tracy.hpp>

#include "core/system_interface.hpp"
#include "fx/node_event_tasks.hpp"

static std::shared_ptr<spdlog::logger> logger;

namespace fx {
    AnimatorTriggeredFx::AnimatorTriggeredFx(
        FxTriggerConfig config_in, const FxCollaborators& collaborators_in, const float poll_interval_in
        ) :
        config{eastl::move(config_in)}, collaborators{collaborators_in}, poll_interval{poll_interval_in} {
        if(logger == nullptr) {
            logger = SystemInterface::get().get_logger("AnimatorTriggeredFx");
        }

        if(collaborators.state_machine == nullptr) {
            logger->error("AnimatorTriggeredFx needs the state machine it works with!");
            throw std::runtime_error{"No animation state machine plugged into AnimatorTriggeredFx"};
        }
        if(collaborators.audio_channels == nullptr) {
            logger->error("No audio channels plugged into AnimatorTriggeredFx!");
            throw std::runtime_error{"No audio channels plugged into AnimatorTriggeredFx"};
        }
        if(collaborators.effect_spawner == nullptr) {
            logger->error("No effect spawner plugged into AnimatorTriggeredFx!");
            throw std::runtime_error{"No effect spawner plugged into AnimatorTriggeredFx"};
        }
        if(collaborators.camera == nullptr) {
            logger->error("No camera plugged into AnimatorTriggeredFx!");
            throw std::runtime_error{"No camera plugged into AnimatorTriggeredFx"};
        }
        if(!collaborators.anchor.valid()) {
            logger->error("AnimatorTriggeredFx needs a valid entity to attach effects to!");
            throw std::runtime_error{"Invalid anchor entity for AnimatorTriggeredFx"};
        }
        if(poll_interval <= 0) {
            throw std::invalid_argument{"AnimatorTriggeredFx poll interval must be positive"};
        }
    }

    void AnimatorTriggeredFx::on_node_enter(const AnimationNodeEvent& event) {
        check_state_machine(event);

        active_nodes.enter(event.node);

        // Figure out which of our on-node-enter events (if any) should be triggered, and trigger it
        const auto itr = eastl::find_if(
            config.on_node_entry.begin(),
            config.on_node_entry.end(),
            [&](const NodeEntryEvent& entry) { return entry.node_id == event.node; });
        if(itr == config.on_node_entry.end()) {
            return;
        }

        logger->debug("Entered node {}", itr->node_name.c_str());

        if(itr->effect) {
            tasks.launch(
                eastl::make_unique<EntryEffectTask>(
                    *itr,
                    active_nodes,
                    *collaborators.effect_spawner,
                    collaborators.anchor,
                    poll_interval));
        }
        if(itr->sound) {
            tasks.launch(
                eastl::make_unique<EntrySoundTask>(*itr, active_nodes, *collaborators.audio_channels, poll_interval));
        }
        if(itr->shake_duration > 0) {
            tasks.launch(eastl::make_unique<EntryCameraShakeTask>(*itr, active_nodes, *collaborators.camera));
        }
    }

    void AnimatorTriggeredFx::on_node_exit(const AnimationNodeEvent& event) {
        check_state_machine(event);

        active_nodes.exit(event.node);

        const auto itr = eastl::find_if(
            config.on_node_exit.begin(),
            config.on_node_exit.end(),
            [&](const NodeExitEvent& exit) { return exit.node_id == event.node; });
        if(itr == config.on_node_exit.end()) {
            return;
        }

        logger->debug("Exited node {}", itr->node_name.c_str());

        if(itr->effect) {
            tasks.launch(eastl::make_unique<ExitEffectTask>(*itr, *collaborators.effect_spawner, collaborators.anchor));
        }
        if(itr->sound) {
            tasks.launch(eastl::make_unique<ExitSoundTask>(*itr, *collaborators.audio_channels));
        }
    }

    void AnimatorTriggeredFx::tick(const float delta_time) {
        ZoneScopedN("AnimatorTriggeredFx::tick");

        tasks.tick(delta_time);
    }

    void AnimatorTriggeredFx::reset() {
        tasks.clear();
        active_nodes.clear();
    }

    bool AnimatorTriggeredFx::is_node_active(const NodeId node) const {
        return active_nodes.is_active(node);
    }

    size_t AnimatorTriggeredFx::num_running_tasks() const {
        return tasks.num_running();
    }

    const FxTriggerConfig& AnimatorTriggeredFx::get_config() const {
        return config;
    }

    void AnimatorTriggeredFx::check_state_machine(const AnimationNodeEvent& event) const {
        if(event.state_machine != collaborators.state_machine) {
            logger->error("Received a node event from a state machine that AnimatorTriggeredFx isn't attached to!");
            throw std::runtime_error{"AnimatorTriggeredFx received an event from the wrong state machine"};
        }
    }
} // fx
