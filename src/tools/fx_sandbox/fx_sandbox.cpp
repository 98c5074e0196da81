/*
 * Plays a scripted series of animation state changes through the FX system, with stand-ins that log what would be
 * spawned, played, and shaken
 *
 * Usage: fx_sandbox <fx_config.json> <animator_graph.json> <timeline.json>
 *
 * The timeline is a JSON array of state changes: [{"time": 0.5, "layer": 0, "state": "Attack"}, ...]
 */

#include <cstdlib>
#include <filesystem>

#include <EASTL/sort.h>
#include <EASTL/unique_ptr.h>
#include <EASTL/vector.h>
#include <entt/entity/registry.hpp>
#include <simdjson.h>
#include <spdlog/spdlog.h>
#include <tracy/Tracy.hpp>

#include "animation/animation_state_machine.hpp"
#include "audio/audio_channel_pool.hpp"
#include "core/fx_settings.hpp"
#include "core/system_interface.hpp"
#include "fx/fx_config_loader.hpp"
#include "fx/fx_trigger_system.hpp"
#include "sandbox_collaborators.hpp"

static constexpr auto EFFECT_LIFETIME = 2.f;

static constexpr auto ONE_SHOT_LENGTH = 0.5f;

/**
 * How long to keep ticking after the last state change, if tasks are still running
 */
static constexpr auto MAX_TAIL_TIME = 30.f;

struct TimelineEvent {
    float time = 0;

    uint32_t layer = 0;

    eastl::string state;
};

static eastl::vector<TimelineEvent> load_timeline(const std::filesystem::path& timeline_file) {
    const auto json = simdjson::padded_string::load(timeline_file.string());
    if(json.error() != simdjson::SUCCESS) {
        throw std::runtime_error{
            fmt::format("Could not load timeline {}: {}", timeline_file.string(), simdjson::error_message(json.error()))
        };
    }

    auto parser = simdjson::ondemand::parser{};
    auto timeline = eastl::vector<TimelineEvent>{};

    simdjson::ondemand::array events;
    if(const auto error = parser.iterate(json.value_unsafe()).get_array().get(events)) {
        throw std::runtime_error{fmt::format("Timeline must be an array: {}", simdjson::error_message(error))};
    }

    for(auto element : events) {
        simdjson::ondemand::object object;
        double time;
        uint64_t layer = 0;
        std::string_view state;
        if(element.get_object().get(object) || object["time"].get_double().get(time) ||
            object["state"].get_string().get(state)) {
            throw std::runtime_error{"Every timeline event needs a time and a state"};
        }
        if(const auto error = object["layer"].get_uint64().get(layer);
            error != simdjson::SUCCESS && error != simdjson::NO_SUCH_FIELD) {
            throw std::runtime_error{fmt::format("Bad timeline layer: {}", simdjson::error_message(error))};
        }

        timeline.emplace_back(TimelineEvent{
            .time = static_cast<float>(time),
            .layer = static_cast<uint32_t>(layer),
            .state = eastl::string{state.data(), state.size()},
        });
    }

    eastl::stable_sort(
        timeline.begin(),
        timeline.end(),
        [](const TimelineEvent& a, const TimelineEvent& b) { return a.time < b.time; });

    return timeline;
}

int main(const int argc, const char** argv) {
    const auto exe_path = std::filesystem::path{argv[0]};
    SystemInterface::initialize(exe_path.parent_path());

    const auto settings = FxSettings::load({});
    settings.apply();

    auto logger = SystemInterface::get().get_logger("fx_sandbox");

    if(argc != 4) {
        logger->error("Usage: {} <fx_config.json> <animator_graph.json> <timeline.json>", exe_path.filename().string());
        return 2;
    }

    try {
        auto config = fx::load_fx_config(ResourcePath{std::string_view{argv[1]}});
        auto state_machine = AnimationStateMachine{fx::load_animator_graph(ResourcePath{std::string_view{argv[2]}})};
        const auto timeline = load_timeline(argv[3]);

        auto channels = eastl::vector<eastl::unique_ptr<SandboxAudioChannel>>{};
        auto channel_pointers = eastl::vector<audio::Channel*>{};
        for(auto i = 0u; i < config.audio_channels; i++) {
            channel_pointers.push_back(
                channels.emplace_back(eastl::make_unique<SandboxAudioChannel>(i, ONE_SHOT_LENGTH)).get());
        }
        const auto channel_pool = audio::ChannelPool{
            eastl::span<audio::Channel* const>{channel_pointers.data(), channel_pointers.size()},
            "Sandbox character"
        };

        auto effect_spawner = SandboxEffectSpawner{EFFECT_LIFETIME};
        auto camera = SandboxCamera{};

        auto registry = entt::registry{};
        auto fx_system = FxTriggerSystem{registry, settings.fixed_timestep};

        const auto character = entt::handle{registry, registry.create()};
        fx_system.add_fx_trigger(
            character,
            state_machine,
            eastl::move(config),
            fx::FxCollaborators{
                .effect_spawner = &effect_spawner,
                .audio_channels = &channel_pool,
                .camera = &camera,
            });

        state_machine.start();

        const auto end_time = timeline.empty() ? 0.f : timeline.back().time;
        auto next_event = timeline.begin();
        auto time = 0.f;
        while(next_event != timeline.end() || (fx_system.num_running_tasks() > 0 && time < end_time + MAX_TAIL_TIME)) {
            ZoneScopedN("Frame");

            while(next_event != timeline.end() && next_event->time <= time) {
                logger->info("t={:.2f}: layer {} -> {}", time, next_event->layer, next_event->state.c_str());
                state_machine.transition_to(
                    next_event->layer,
                    eastl::string_view{next_event->state.data(), next_event->state.size()});
                ++next_event;
            }

            fx_system.tick(settings.fixed_timestep);
            effect_spawner.tick(settings.fixed_timestep);
            for(auto& channel : channels) {
                channel->tick(settings.fixed_timestep);
            }

            time += settings.fixed_timestep;
        }

        state_machine.stop();
        registry.clear();

        logger->info("Done after {:.2f} seconds, spawned {} effects", time, effect_spawner.get_num_spawned());
    } catch(const std::exception& e) {
        logger->error("Sandbox failed: {}", e.what());
        SystemInterface::get().flush_all_loggers();
        return 2;
    }

    SystemInterface::get().flush_all_loggers();

    return EXIT_SUCCESS;
}
