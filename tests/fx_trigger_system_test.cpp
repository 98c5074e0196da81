#include <gtest/gtest.h>

#include <entt/entity/registry.hpp>

#include "animation/animation_state_machine.hpp"
#include "fakes.hpp"
#include "fx/fx_trigger_component.hpp"
#include "fx/fx_trigger_system.hpp"

static fx::FxTriggerConfig make_config(const char* node_name, const char* effect, const float spawn_delay) {
    auto event = fx::NodeEntryEvent{};
    event.node_name = node_name;
    event.node_id = to_node_id(node_name);
    event.effect = ResourcePath{eastl::string_view{effect}};
    event.spawn_delay = spawn_delay;

    auto config = fx::FxTriggerConfig{};
    config.on_node_entry.push_back(event);
    return config;
}

class FxTriggerSystemTest : public testing::Test {
protected:
    FxTriggerSystemTest() :
        channel_pool{as_span(channel_pointers)},
        state_machine{
            eastl::vector<AnimationLayer>{AnimationLayer{.name = "Base", .states = {"Idle", "Attack", "Block"}}}
        },
        fx_system{registry, 0.02f} {
    }

    fx::FxCollaborators make_collaborators() {
        return fx::FxCollaborators{
            .effect_spawner = &spawner,
            .audio_channels = &channel_pool,
            .camera = &camera,
        };
    }

    // The collaborators are declared first so they outlive the triggers in the registry
    FakeAudioChannel channel;

    eastl::vector<audio::Channel*> channel_pointers = {&channel};

    audio::ChannelPool channel_pool;

    FakeEffectSpawner spawner;

    FakeCamera camera;

    AnimationStateMachine state_machine;

    entt::registry registry;

    FxTriggerSystem fx_system;
};

TEST_F(FxTriggerSystemTest, SiblingTriggersWorkIndependently) {
    const auto character = entt::handle{registry, registry.create()};
    fx_system.add_fx_trigger(
        character,
        state_machine,
        make_config("Attack", "res://fx/slash.fx", 0),
        make_collaborators());
    fx_system.add_fx_trigger(
        character,
        state_machine,
        make_config("Attack", "res://fx/sparks.fx", 0.1f),
        make_collaborators());

    ASSERT_TRUE(character.all_of<FxTriggerComponent>());
    EXPECT_EQ(character.get<FxTriggerComponent>().triggers.size(), 2);

    state_machine.start();
    state_machine.transition_to(0, "Attack");

    ASSERT_EQ(spawner.spawned.size(), 1);
    EXPECT_EQ(fx_system.num_running_tasks(), 1);

    fx_system.tick(0.15f);

    ASSERT_EQ(spawner.spawned.size(), 2);
    EXPECT_EQ(spawner.spawned[1].effect, "res://fx/sparks.fx"_res);
    EXPECT_EQ(spawner.spawned[1].anchor, character);
    EXPECT_EQ(fx_system.num_running_tasks(), 0);
}

TEST_F(FxTriggerSystemTest, TicksEveryCharacter) {
    auto other_state_machine = AnimationStateMachine{state_machine.get_layers()};

    const auto knight = entt::handle{registry, registry.create()};
    const auto archer = entt::handle{registry, registry.create()};
    fx_system.add_fx_trigger(knight, state_machine, make_config("Attack", "res://fx/slash.fx", 0.1f), make_collaborators());
    fx_system.add_fx_trigger(
        archer,
        other_state_machine,
        make_config("Attack", "res://fx/arrow.fx", 0.1f),
        make_collaborators());

    state_machine.start();
    other_state_machine.start();
    state_machine.transition_to(0, "Attack");
    other_state_machine.transition_to(0, "Attack");

    EXPECT_EQ(fx_system.num_running_tasks(), 2);

    fx_system.tick(0.15f);

    ASSERT_EQ(spawner.spawned.size(), 2);
    EXPECT_EQ(spawner.spawned[0].anchor, knight);
    EXPECT_EQ(spawner.spawned[1].anchor, archer);

    registry.clear();
}

TEST_F(FxTriggerSystemTest, CharacterCanOnlyListenToOneStateMachine) {
    auto other_state_machine = AnimationStateMachine{state_machine.get_layers()};
    const auto character = entt::handle{registry, registry.create()};
    fx_system.add_fx_trigger(character, state_machine, fx::FxTriggerConfig{}, make_collaborators());

    EXPECT_THROW(
        fx_system.add_fx_trigger(character, other_state_machine, fx::FxTriggerConfig{}, make_collaborators()),
        std::runtime_error);
}

TEST_F(FxTriggerSystemTest, DestroyingCharacterStopsListening) {
    auto character = entt::handle{registry, registry.create()};
    fx_system.add_fx_trigger(
        character,
        state_machine,
        make_config("Attack", "res://fx/slash.fx", 0),
        make_collaborators());

    character.destroy();

    state_machine.start();
    state_machine.transition_to(0, "Attack");

    EXPECT_TRUE(spawner.spawned.empty());
    EXPECT_EQ(fx_system.num_running_tasks(), 0);
}

TEST_F(FxTriggerSystemTest, DestroyingCharacterStopsItsLoopingSounds) {
    auto config = fx::FxTriggerConfig{};
    auto& entry = config.on_node_entry.emplace_back();
    entry.node_name = "Block";
    entry.node_id = to_node_id("Block");
    entry.sound = "res://sfx/shield_hum.ogg"_res;
    entry.loop = true;

    auto character = entt::handle{registry, registry.create()};
    fx_system.add_fx_trigger(character, state_machine, eastl::move(config), make_collaborators());

    state_machine.start();
    state_machine.transition_to(0, "Block");
    ASSERT_TRUE(channel.playing);

    character.destroy();

    EXPECT_FALSE(channel.playing);
    EXPECT_EQ(channel.num_stops, 1);
    EXPECT_EQ(fx_system.num_running_tasks(), 0);
}
