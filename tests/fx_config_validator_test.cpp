#include <gtest/gtest.h>

#include "fx/fx_config_validator.hpp"

static const auto GRAPH_NODES = eastl::vector<eastl::string>{"Idle", "Attack", "Block", "Run"};

static fx::NodeEntryEvent make_entry_event(const char* node_name) {
    auto event = fx::NodeEntryEvent{};
    event.node_name = node_name;
    event.node_id = to_node_id(node_name);
    return event;
}

static fx::NodeExitEvent make_exit_event(const char* node_name) {
    auto event = fx::NodeExitEvent{};
    event.node_name = node_name;
    event.node_id = to_node_id(node_name);
    return event;
}

static size_t count_containing(const eastl::vector<eastl::string>& messages, const char* text) {
    auto count = size_t{0};
    for(const auto& message : messages) {
        if(message.find(text) != eastl::string::npos) {
            count++;
        }
    }
    return count;
}

TEST(FxConfigValidator, ValidConfigSucceeds) {
    auto config = fx::FxTriggerConfig{};
    config.on_node_entry.push_back(make_entry_event("Attack"));
    config.on_node_entry.push_back(make_entry_event("Block"));
    config.on_node_exit.push_back(make_exit_event("Attack"));

    const auto report = fx::validate_fx_config(config, GRAPH_NODES);

    EXPECT_TRUE(report.succeeded());
    EXPECT_TRUE(report.warnings.empty());
    EXPECT_EQ(report.num_referenced_names, 2);
}

TEST(FxConfigValidator, ReportsEachDuplicatePairOnce) {
    auto config = fx::FxTriggerConfig{};
    config.on_node_entry.push_back(make_entry_event("Attack"));
    config.on_node_entry.push_back(make_entry_event("Idle"));
    config.on_node_entry.push_back(make_entry_event("Attack"));
    config.on_node_entry.push_back(make_entry_event("Block"));

    const auto report = fx::validate_fx_config(config, GRAPH_NODES);

    ASSERT_EQ(report.errors.size(), 1);
    EXPECT_EQ(count_containing(report.errors, "Entries 0 and 2 in on_node_entry"), 1);
    EXPECT_EQ(count_containing(report.errors, "(Attack)"), 1);
}

TEST(FxConfigValidator, DuplicateDetectionIgnoresOrderOfOtherEvents) {
    auto config = fx::FxTriggerConfig{};
    config.on_node_entry.push_back(make_entry_event("Block"));
    config.on_node_entry.push_back(make_entry_event("Run"));
    config.on_node_entry.push_back(make_entry_event("Attack"));
    config.on_node_entry.push_back(make_entry_event("Idle"));
    config.on_node_entry.push_back(make_entry_event("Attack"));

    const auto report = fx::validate_fx_config(config, GRAPH_NODES);

    ASSERT_EQ(report.errors.size(), 1);
    EXPECT_EQ(count_containing(report.errors, "Entries 2 and 4 in on_node_entry"), 1);
}

TEST(FxConfigValidator, EntryAndExitListsAreCheckedSeparately) {
    auto config = fx::FxTriggerConfig{};
    config.on_node_entry.push_back(make_entry_event("Attack"));
    config.on_node_exit.push_back(make_exit_event("Attack"));
    config.on_node_exit.push_back(make_exit_event("Attack"));

    const auto report = fx::validate_fx_config(config, GRAPH_NODES);

    ASSERT_EQ(report.errors.size(), 1);
    EXPECT_EQ(count_containing(report.errors, "Entries 0 and 1 in on_node_exit"), 1);
}

TEST(FxConfigValidator, UnnamedEventsAreNotDuplicates) {
    auto config = fx::FxTriggerConfig{};
    config.on_node_entry.push_back(make_entry_event(""));
    config.on_node_entry.push_back(make_entry_event(""));

    const auto report = fx::validate_fx_config(config, GRAPH_NODES);

    EXPECT_EQ(count_containing(report.errors, "refer to the same node name"), 0);
}

TEST(FxConfigValidator, ReportsUnknownNodeName) {
    auto config = fx::FxTriggerConfig{};
    config.on_node_entry.push_back(make_entry_event("Attack"));
    config.on_node_entry.push_back(make_entry_event("Atack"));

    const auto report = fx::validate_fx_config(config, GRAPH_NODES);

    ASSERT_EQ(report.errors.size(), 1);
    EXPECT_EQ(
        report.errors[0],
        eastl::string{"Could not find animation node named Atack (on_node_entry index 1)"});
    EXPECT_FALSE(report.succeeded());
}

TEST(FxConfigValidator, UnknownExitNodeNamesTheExitList) {
    auto config = fx::FxTriggerConfig{};
    config.on_node_exit.push_back(make_exit_event("Jump"));

    const auto report = fx::validate_fx_config(config, GRAPH_NODES);

    ASSERT_EQ(report.errors.size(), 1);
    EXPECT_EQ(count_containing(report.errors, "Jump (on_node_exit index 0)"), 1);
}

TEST(FxConfigValidator, WarnsAboutMissingAudioChannels) {
    auto config = fx::FxTriggerConfig{};
    config.audio_channels = 0;
    config.on_node_entry.push_back(make_entry_event("Attack"));

    const auto report = fx::validate_fx_config(config, GRAPH_NODES);

    EXPECT_TRUE(report.succeeded());
    EXPECT_EQ(report.warnings.size(), 1);
}

TEST(FxConfigValidator, ReportsHashCollisionsInGraph) {
    // These two names have the same 32-bit FNV-1a hash
    ASSERT_EQ(to_node_id("costarring"), to_node_id("liquid"));

    const auto graph = eastl::vector<eastl::string>{"Idle", "costarring", "liquid"};

    const auto report = fx::validate_fx_config(fx::FxTriggerConfig{}, graph);

    ASSERT_EQ(report.errors.size(), 1);
    EXPECT_EQ(count_containing(report.errors, "costarring and liquid have the same hash"), 1);
}

TEST(FxConfigValidator, ReadsNamesFromEveryLayer) {
    const auto layers = eastl::vector<AnimationLayer>{
        AnimationLayer{.name = "Base", .states = {"Idle", "Attack"}},
        AnimationLayer{.name = "Upper Body", .states = {"Wave"}},
    };

    auto config = fx::FxTriggerConfig{};
    config.on_node_entry.push_back(make_entry_event("Wave"));
    config.on_node_exit.push_back(make_exit_event("Attack"));

    const auto report = fx::validate_fx_config(config, layers);

    EXPECT_TRUE(report.succeeded());
    EXPECT_EQ(report.num_referenced_names, 2);
}
