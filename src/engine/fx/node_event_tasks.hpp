#pragma once

#include <EASTL/shared_ptr.h>
#include <entt/entity/handle.hpp>

#include "audio/audio_channel_pool.hpp"
#include "camera/camera_shaker.hpp"
#include "fx/effect_spawner.hpp"
#include "fx/fx_event_config.hpp"
#include "fx/fx_task.hpp"
#include "fx/node_residency_set.hpp"

/*
 * The tasks that AnimatorTriggeredFx launches when nodes are entered or exited. Each one handles a single concern of
 * one event - the effect, the sound, or the camera shake
 */

namespace fx {
    /**
     * Spawns the effect of an on-entry event, and shuts it down again if the character leaves the node before the
     * event's abort deadline
     */
    class EntryEffectTask final : public FxTask {
    public:
        EntryEffectTask(
            const NodeEntryEvent& event_in, const NodeResidencySet& residency_in, EffectSpawner& spawner_in,
            entt::handle anchor_in, float poll_interval
            );

        TaskStatus tick(float delta_time) override;

    private:
        enum class Phase {
            WaitingToSpawn,
            WatchingForExit,
        };

        const NodeEntryEvent& event;

        const NodeResidencySet& residency;

        EffectSpawner& spawner;

        entt::handle anchor;

        Phase phase = Phase::WaitingToSpawn;

        Countdown spawn_delay;

        FixedStepTimer poll_timer;

        /**
         * How much longer the effect can be aborted for
         */
        float abortable_time_remaining = 0;

        eastl::weak_ptr<SpecialFxGraphic> effect_instance;

        TaskStatus spawn_effect();

        bool is_effect_alive() const;
    };

    /**
     * Plays the sound of an on-entry event. Looping sounds get a channel of their own, and are stopped when the
     * character leaves the node, or when the task is dropped before that
     */
    class EntrySoundTask final : public FxTask {
    public:
        EntrySoundTask(
            const NodeEntryEvent& event_in, const NodeResidencySet& residency_in, const audio::ChannelPool& channels_in,
            float poll_interval
            );

        ~EntrySoundTask() override;

        EntrySoundTask(const EntrySoundTask& other) = delete;

        EntrySoundTask& operator=(const EntrySoundTask& other) = delete;

        TaskStatus tick(float delta_time) override;

    private:
        enum class Phase {
            WaitingToPlay,
            Looping,
            Stopped,
        };

        const NodeEntryEvent& event;

        const NodeResidencySet& residency;

        const audio::ChannelPool& channels;

        Phase phase = Phase::WaitingToPlay;

        Countdown sound_delay;

        FixedStepTimer poll_timer;

        audio::Channel* loop_channel = nullptr;

        TaskStatus start_sound();
    };

    /**
     * Shakes the camera for an on-entry event
     */
    class EntryCameraShakeTask final : public FxTask {
    public:
        EntryCameraShakeTask(const NodeEntryEvent& event_in, const NodeResidencySet& residency_in, CameraShaker& shaker_in);

        TaskStatus tick(float delta_time) override;

    private:
        const NodeEntryEvent& event;

        const NodeResidencySet& residency;

        CameraShaker& shaker;

        Countdown shake_delay;
    };

    /**
     * Spawns the effect of an on-exit event. Nothing can stop it once it's launched
     */
    class ExitEffectTask final : public FxTask {
    public:
        ExitEffectTask(const NodeExitEvent& event_in, EffectSpawner& spawner_in, entt::handle anchor_in);

        TaskStatus tick(float delta_time) override;

    private:
        const NodeExitEvent& event;

        EffectSpawner& spawner;

        entt::handle anchor;

        Countdown spawn_delay;
    };

    /**
     * Plays the sound of an on-exit event as a one-shot. Nothing can stop it once it's launched
     */
    class ExitSoundTask final : public FxTask {
    public:
        ExitSoundTask(const NodeExitEvent& event_in, const audio::ChannelPool& channels_in);

        TaskStatus tick(float delta_time) override;

    private:
        const NodeExitEvent& event;

        const audio::ChannelPool& channels;

        Countdown sound_delay;
    };
} // fx
