#include "sandbox_collaborators.hpp"

#include <EASTL/algorithm.h>
#include <spdlog/spdlog.h>

#include "core/system_interface.hpp"

static std::shared_ptr<spdlog::logger> logger;

static spdlog::logger& get_logger() {
    if(logger == nullptr) {
        logger = SystemInterface::get().get_logger("Sandbox");
    }
    return *logger;
}

SandboxFxGraphic::SandboxFxGraphic(ResourcePath effect_in, const float lifetime_in) :
    effect{std::move(effect_in)}, lifetime{lifetime_in} {
}

void SandboxFxGraphic::shutdown() {
    if(!shutting_down) {
        get_logger().info("Shutting down effect {}", effect);
        shutting_down = true;
    }
}

bool SandboxFxGraphic::is_alive() const {
    return !shutting_down && lifetime > 0;
}

void SandboxFxGraphic::tick(const float delta_time) {
    lifetime -= delta_time;
}

SandboxEffectSpawner::SandboxEffectSpawner(const float effect_lifetime_in) :
    effect_lifetime{effect_lifetime_in} {
}

eastl::shared_ptr<fx::SpecialFxGraphic> SandboxEffectSpawner::instantiate(
    const ResourcePath& effect, const entt::handle anchor
    ) {
    get_logger().info("Spawning effect {} on entity {}", effect, static_cast<uint32_t>(anchor.entity()));
    num_spawned++;
    return live_effects.emplace_back(eastl::make_shared<SandboxFxGraphic>(effect, effect_lifetime));
}

void SandboxEffectSpawner::tick(const float delta_time) {
    for(auto& effect : live_effects) {
        effect->tick(delta_time);
    }

    live_effects.erase(
        eastl::remove_if(
            live_effects.begin(),
            live_effects.end(),
            [](const eastl::shared_ptr<SandboxFxGraphic>& effect) { return !effect->is_alive(); }),
        live_effects.end());
}

size_t SandboxEffectSpawner::get_num_spawned() const {
    return num_spawned;
}

SandboxAudioChannel::SandboxAudioChannel(const uint32_t index_in, const float one_shot_length_in) :
    index{index_in}, one_shot_length{one_shot_length_in} {
}

void SandboxAudioChannel::play_one_shot(const ResourcePath& clip_in, const float volume_in) {
    get_logger().info("Channel {}: one-shot {} at volume {}", index, clip_in, volume_in);
    one_shot_remaining = one_shot_length;
}

void SandboxAudioChannel::set_volume(const float volume_in) {
    volume = volume_in;
}

void SandboxAudioChannel::set_loop(const bool loop_in) {
    loop = loop_in;
}

void SandboxAudioChannel::set_clip(const ResourcePath& clip_in) {
    clip = clip_in;
}

void SandboxAudioChannel::play() {
    get_logger().info("Channel {}: playing {} at volume {}{}", index, clip, volume, loop ? " (looping)" : "");
    playing_clip = true;
}

bool SandboxAudioChannel::is_playing() const {
    return playing_clip || one_shot_remaining > 0;
}

void SandboxAudioChannel::stop() {
    if(playing_clip) {
        get_logger().info("Channel {}: stopping {}", index, clip);
    }
    playing_clip = false;
    one_shot_remaining = 0;
}

void SandboxAudioChannel::tick(const float delta_time) {
    one_shot_remaining = eastl::max(one_shot_remaining - delta_time, 0.f);
}

void SandboxCamera::shake_camera(const float frequency, const float amplitude, const float duration) {
    get_logger().info("Shaking camera at {} Hz, amplitude {}, for {} seconds", frequency, amplitude, duration);
}
