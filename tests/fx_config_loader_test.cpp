#include <gtest/gtest.h>

#include "fx/fx_config_loader.hpp"

TEST(FxConfigLoader, ParsesFullConfig) {
    const auto config = fx::parse_fx_config(R"({
        "dev_notes": "tank class",
        "audio_channels": 2,
        "on_node_entry": [
            {
                "node": "Attack", "effect": "res://fx/slash.fx", "spawn_delay": 0.2, "abort_deadline": 0.5,
                "sound": "res://sfx/whoosh.ogg", "sound_delay": 0.1, "volume": 0.5, "loop": true,
                "shake_delay": 0.3, "shake_duration": 0.4, "shake_frequency": 20, "shake_amplitude": 0.25
            }
        ],
        "on_node_exit": [
            { "node": "Attack", "effect": "res://fx/dust.fx", "spawn_delay": 0.1, "sound": "res://sfx/land.ogg",
              "sound_delay": 0.05, "volume": 0.75 }
        ]
    })");

    EXPECT_EQ(config.dev_notes, "tank class");
    EXPECT_EQ(config.audio_channels, 2);

    ASSERT_EQ(config.on_node_entry.size(), 1);
    const auto& entry = config.on_node_entry[0];
    EXPECT_EQ(entry.node_name, "Attack");
    EXPECT_EQ(entry.node_id, to_node_id("Attack"));
    ASSERT_TRUE(entry.effect);
    EXPECT_EQ(*entry.effect, "res://fx/slash.fx"_res);
    EXPECT_FLOAT_EQ(entry.spawn_delay, 0.2f);
    EXPECT_FLOAT_EQ(entry.abort_deadline, 0.5f);
    ASSERT_TRUE(entry.sound);
    EXPECT_EQ(*entry.sound, "res://sfx/whoosh.ogg"_res);
    EXPECT_FLOAT_EQ(entry.sound_delay, 0.1f);
    EXPECT_FLOAT_EQ(entry.volume, 0.5f);
    EXPECT_TRUE(entry.loop);
    EXPECT_FLOAT_EQ(entry.shake_delay, 0.3f);
    EXPECT_FLOAT_EQ(entry.shake_duration, 0.4f);
    EXPECT_FLOAT_EQ(entry.shake_frequency, 20);
    EXPECT_FLOAT_EQ(entry.shake_amplitude, 0.25f);

    ASSERT_EQ(config.on_node_exit.size(), 1);
    const auto& exit = config.on_node_exit[0];
    EXPECT_EQ(exit.node_id, to_node_id("Attack"));
    ASSERT_TRUE(exit.effect);
    EXPECT_EQ(*exit.effect, "res://fx/dust.fx"_res);
    EXPECT_FLOAT_EQ(exit.spawn_delay, 0.1f);
    ASSERT_TRUE(exit.sound);
    EXPECT_FLOAT_EQ(exit.sound_delay, 0.05f);
    EXPECT_FLOAT_EQ(exit.volume, 0.75f);
}

TEST(FxConfigLoader, UsesDefaultsForMissingFields) {
    const auto config = fx::parse_fx_config(R"({"on_node_entry": [{"node": "Idle"}]})");

    EXPECT_TRUE(config.dev_notes.empty());
    EXPECT_EQ(config.audio_channels, 1);
    EXPECT_TRUE(config.on_node_exit.empty());

    ASSERT_EQ(config.on_node_entry.size(), 1);
    const auto& entry = config.on_node_entry[0];
    EXPECT_FALSE(entry.effect);
    EXPECT_FALSE(entry.sound);
    EXPECT_EQ(entry.spawn_delay, 0);
    EXPECT_EQ(entry.abort_deadline, 0);
    EXPECT_EQ(entry.volume, 1);
    EXPECT_FALSE(entry.loop);
    EXPECT_EQ(entry.shake_duration, 0);
}

TEST(FxConfigLoader, EmptyPathsMeanNoResource) {
    const auto config = fx::parse_fx_config(R"({"on_node_exit": [{"node": "Idle", "effect": "", "sound": ""}]})");

    ASSERT_EQ(config.on_node_exit.size(), 1);
    EXPECT_FALSE(config.on_node_exit[0].effect);
    EXPECT_FALSE(config.on_node_exit[0].sound);
}

TEST(FxConfigLoader, RejectsEventWithoutNode) {
    EXPECT_THROW(fx::parse_fx_config(R"({"on_node_entry": [{"effect": "res://fx/slash.fx"}]})"), std::runtime_error);
}

TEST(FxConfigLoader, RejectsNegativeDelays) {
    try {
        fx::parse_fx_config(R"({"on_node_entry": [{"node": "Idle"}, {"node": "Attack", "spawn_delay": -1}]})");
        FAIL() << "Negative delay was accepted";
    } catch(const std::runtime_error& e) {
        EXPECT_NE(std::string{e.what()}.find("on_node_entry index 1"), std::string::npos);
    }

    EXPECT_THROW(
        fx::parse_fx_config(R"({"on_node_exit": [{"node": "Idle", "sound_delay": -0.5}]})"),
        std::runtime_error);
}

TEST(FxConfigLoader, RejectsAudioChannelCountsThatDontFit) {
    EXPECT_THROW(fx::parse_fx_config(R"({"audio_channels": 4294967296})"), std::runtime_error);
    EXPECT_THROW(fx::parse_fx_config(R"({"audio_channels": -1})"), std::runtime_error);

    const auto config = fx::parse_fx_config(R"({"audio_channels": 4294967295})");
    EXPECT_EQ(config.audio_channels, 4294967295u);
}

TEST(FxConfigLoader, RejectsMalformedJson) {
    EXPECT_THROW(fx::parse_fx_config(R"({"on_node_entry": [{"node": )"), std::runtime_error);
    EXPECT_THROW(fx::parse_fx_config(R"({"on_node_entry": [{"node": 5}]})"), std::runtime_error);
}

TEST(FxConfigLoader, ParsesController) {
    const auto layers = fx::parse_animator_graph(R"({
        "type": "controller",
        "layers": [
            {"name": "Base", "states": ["Idle", "Attack"]},
            {"name": "Upper Body", "states": ["Wave"]}
        ]
    })");

    ASSERT_EQ(layers.size(), 2);
    EXPECT_EQ(layers[0].name, "Base");
    ASSERT_EQ(layers[0].states.size(), 2);
    EXPECT_EQ(layers[0].states[1], "Attack");
    EXPECT_EQ(layers[1].name, "Upper Body");
    ASSERT_EQ(layers[1].states.size(), 1);
    EXPECT_EQ(layers[1].states[0], "Wave");
}

TEST(FxConfigLoader, ParsesOverrideControllerBase) {
    const auto layers = fx::parse_animator_graph(R"({
        "type": "override_controller",
        "base": {"type": "controller", "layers": [{"name": "Base", "states": ["Idle"]}]}
    })");

    ASSERT_EQ(layers.size(), 1);
    EXPECT_EQ(layers[0].states[0], "Idle");
}

TEST(FxConfigLoader, RejectsUnrecognizedGraphTypes) {
    EXPECT_THROW(
        fx::parse_animator_graph(R"({"type": "blend_tree", "layers": []})"),
        fx::UnrecognizedGraphTypeError);

    EXPECT_THROW(fx::parse_animator_graph(R"({"layers": []})"), fx::UnrecognizedGraphTypeError);

    // Override controllers can't wrap other override controllers
    EXPECT_THROW(
        fx::parse_animator_graph(R"({
            "type": "override_controller",
            "base": {"type": "override_controller", "base": {"type": "controller", "layers": []}}
        })"),
        fx::UnrecognizedGraphTypeError);
}

TEST(FxConfigLoader, MissingFileThrows) {
    EXPECT_THROW(fx::load_fx_config("file://does/not/exist.json"_res), std::runtime_error);
}
