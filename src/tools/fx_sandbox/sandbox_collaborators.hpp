#pragma once

#include <EASTL/shared_ptr.h>
#include <EASTL/vector.h>

#include "audio/audio_channel.hpp"
#include "camera/camera_shaker.hpp"
#include "fx/effect_spawner.hpp"

/*
 * Stand-ins for the renderer, the audio engine, and the camera. They log what they're asked to do, and pretend that
 * time passes for the things they're playing
 */

/**
 * An effect that plays for a fixed amount of time, then dies
 */
class SandboxFxGraphic final : public fx::SpecialFxGraphic {
public:
    SandboxFxGraphic(ResourcePath effect_in, float lifetime_in);

    void shutdown() override;

    bool is_alive() const override;

    void tick(float delta_time);

private:
    ResourcePath effect;

    float lifetime;

    bool shutting_down = false;
};

class SandboxEffectSpawner final : public fx::EffectSpawner {
public:
    explicit SandboxEffectSpawner(float effect_lifetime_in);

    eastl::shared_ptr<fx::SpecialFxGraphic> instantiate(const ResourcePath& effect, entt::handle anchor) override;

    /**
     * Ages all the live effects, and forgets the ones that have died
     */
    void tick(float delta_time);

    size_t get_num_spawned() const;

private:
    float effect_lifetime;

    size_t num_spawned = 0;

    eastl::vector<eastl::shared_ptr<SandboxFxGraphic>> live_effects;
};

class SandboxAudioChannel final : public audio::Channel {
public:
    SandboxAudioChannel(uint32_t index_in, float one_shot_length_in);

    void play_one_shot(const ResourcePath& clip_in, float volume_in) override;

    void set_volume(float volume_in) override;

    void set_loop(bool loop_in) override;

    void set_clip(const ResourcePath& clip_in) override;

    void play() override;

    bool is_playing() const override;

    void stop() override;

    void tick(float delta_time);

private:
    uint32_t index;

    float one_shot_length;

    ResourcePath clip;

    float volume = 1;

    bool loop = false;

    bool playing_clip = false;

    /**
     * How much longer the most recent one-shot plays for
     */
    float one_shot_remaining = 0;
};

class SandboxCamera final : public CameraShaker {
public:
    void shake_camera(float frequency, float amplitude, float duration) override;
};
