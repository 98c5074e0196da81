#include "node_event_tasks.hpp"

#include <spdlog/spdlog.h>

#include "core/system_interface.hpp"

static std::shared_ptr<spdlog::logger> logger;

static spdlog::logger& get_logger() {
    if(logger == nullptr) {
        logger = SystemInterface::get().get_logger("NodeEventTasks");
    }
    return *logger;
}

namespace fx {
    EntryEffectTask::EntryEffectTask(
        const NodeEntryEvent& event_in, const NodeResidencySet& residency_in, EffectSpawner& spawner_in,
        const entt::handle anchor_in, const float poll_interval
        ) :
        event{event_in}, residency{residency_in}, spawner{spawner_in}, anchor{anchor_in},
        spawn_delay{event_in.spawn_delay}, poll_timer{poll_interval} {
    }

    TaskStatus EntryEffectTask::tick(float delta_time) {
        if(phase == Phase::WaitingToSpawn) {
            if(!spawn_delay.advance(delta_time)) {
                return TaskStatus::Running;
            }

            if(const auto status = spawn_effect(); status != TaskStatus::Running) {
                return status;
            }
        }

        // Watch the new effect and see if we need to end it prematurely
        const auto num_polls = poll_timer.advance(delta_time);
        for(auto poll = 0u; poll < num_polls; poll++) {
            if(!is_effect_alive()) {
                return TaskStatus::Completed;
            }

            abortable_time_remaining -= poll_timer.get_interval();

            if(!residency.is_active(event.node_id)) {
                get_logger().debug("Left node {}, shutting down its effect", event.node_name.c_str());
                if(const auto instance = effect_instance.lock()) {
                    instance->shutdown();
                }
                return TaskStatus::Completed;
            }

            if(abortable_time_remaining <= 0) {
                // Too late to cancel, the effect plays out no matter what
                return TaskStatus::Completed;
            }
        }

        return TaskStatus::Running;
    }

    TaskStatus EntryEffectTask::spawn_effect() {
        if(!residency.is_active(event.node_id)) {
            return TaskStatus::Aborted;
        }

        const auto instance = spawner.instantiate(*event.effect, anchor);
        if(instance == nullptr) {
            get_logger().warn("Could not instantiate effect {} for node {}", *event.effect, event.node_name.c_str());
            return TaskStatus::Aborted;
        }

        if(event.abort_deadline <= 0) {
            return TaskStatus::Completed;
        }

        abortable_time_remaining = event.abort_deadline - event.spawn_delay;
        if(abortable_time_remaining <= 0) {
            return TaskStatus::Completed;
        }

        effect_instance = instance;
        phase = Phase::WatchingForExit;

        return TaskStatus::Running;
    }

    bool EntryEffectTask::is_effect_alive() const {
        const auto instance = effect_instance.lock();
        return instance != nullptr && instance->is_alive();
    }

    EntrySoundTask::EntrySoundTask(
        const NodeEntryEvent& event_in, const NodeResidencySet& residency_in, const audio::ChannelPool& channels_in,
        const float poll_interval
        ) :
        event{event_in}, residency{residency_in}, channels{channels_in}, sound_delay{event_in.sound_delay},
        poll_timer{poll_interval} {
    }

    EntrySoundTask::~EntrySoundTask() {
        // Nobody else will ever stop the loop
        if(phase == Phase::Looping) {
            get_logger().debug("Dropped the loop for node {} while it was playing", event.node_name.c_str());
            loop_channel->stop();
        }
    }

    TaskStatus EntrySoundTask::tick(float delta_time) {
        if(phase == Phase::WaitingToPlay) {
            if(!sound_delay.advance(delta_time)) {
                return TaskStatus::Running;
            }

            if(const auto status = start_sound(); status != TaskStatus::Running) {
                return status;
            }
        }

        const auto num_polls = poll_timer.advance(delta_time);
        for(auto poll = 0u; poll < num_polls; poll++) {
            if(!residency.is_active(event.node_id) || !loop_channel->is_playing()) {
                loop_channel->stop();
                phase = Phase::Stopped;
                return TaskStatus::Completed;
            }
        }

        return TaskStatus::Running;
    }

    TaskStatus EntrySoundTask::start_sound() {
        if(!residency.is_active(event.node_id)) {
            return TaskStatus::Aborted;
        }

        if(!event.loop) {
            channels.one_shot_channel().play_one_shot(*event.sound, event.volume);
            return TaskStatus::Completed;
        }

        loop_channel = channels.acquire();
        if(loop_channel == nullptr) {
            // We're using all our channels already, just give up
            return TaskStatus::Aborted;
        }

        loop_channel->set_volume(event.volume);
        loop_channel->set_loop(true);
        loop_channel->set_clip(*event.sound);
        loop_channel->play();

        phase = Phase::Looping;

        return TaskStatus::Running;
    }

    EntryCameraShakeTask::EntryCameraShakeTask(
        const NodeEntryEvent& event_in, const NodeResidencySet& residency_in, CameraShaker& shaker_in
        ) :
        event{event_in}, residency{residency_in}, shaker{shaker_in}, shake_delay{event_in.shake_delay} {
    }

    TaskStatus EntryCameraShakeTask::tick(float delta_time) {
        if(!shake_delay.advance(delta_time)) {
            return TaskStatus::Running;
        }

        if(!residency.is_active(event.node_id)) {
            return TaskStatus::Aborted;
        }

        shaker.shake_camera(event.shake_frequency, event.shake_amplitude, event.shake_duration);

        return TaskStatus::Completed;
    }

    ExitEffectTask::ExitEffectTask(const NodeExitEvent& event_in, EffectSpawner& spawner_in, const entt::handle anchor_in) :
        event{event_in}, spawner{spawner_in}, anchor{anchor_in}, spawn_delay{event_in.spawn_delay} {
    }

    TaskStatus ExitEffectTask::tick(float delta_time) {
        if(!spawn_delay.advance(delta_time)) {
            return TaskStatus::Running;
        }

        if(spawner.instantiate(*event.effect, anchor) == nullptr) {
            get_logger().warn("Could not instantiate effect {} for node {}", *event.effect, event.node_name.c_str());
        }

        return TaskStatus::Completed;
    }

    ExitSoundTask::ExitSoundTask(const NodeExitEvent& event_in, const audio::ChannelPool& channels_in) :
        event{event_in}, channels{channels_in}, sound_delay{event_in.sound_delay} {
    }

    TaskStatus ExitSoundTask::tick(float delta_time) {
        if(!sound_delay.advance(delta_time)) {
            return TaskStatus::Running;
        }

        channels.one_shot_channel().play_one_shot(*event.sound, event.volume);

        return TaskStatus::Completed;
    }
} // fx
