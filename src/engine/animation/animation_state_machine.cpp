#include "animation_state_machine.hpp"

#include <stdexcept>
#include <string>

#include <EASTL/algorithm.h>
#include <spdlog/spdlog.h>

#include "core/system_interface.hpp"

static std::shared_ptr<spdlog::logger> logger;

AnimationStateMachine::AnimationStateMachine(eastl::vector<AnimationLayer> layers_in) :
    layers{eastl::move(layers_in)} {
    if(logger == nullptr) {
        logger = SystemInterface::get().get_logger("AnimationStateMachine");
    }

    current_nodes.resize(layers.size());
}

void AnimationStateMachine::add_listener(AnimationNodeListener* listener) {
    if(eastl::find(listeners.begin(), listeners.end(), listener) == listeners.end()) {
        listeners.push_back(listener);
    }
}

void AnimationStateMachine::remove_listener(AnimationNodeListener* listener) {
    listeners.erase(eastl::remove(listeners.begin(), listeners.end(), listener), listeners.end());
}

void AnimationStateMachine::start() {
    for(auto layer_index = 0u; layer_index < layers.size(); layer_index++) {
        const auto& layer = layers[layer_index];
        if(layer.states.empty()) {
            logger->warn("Layer {} has no states, it will never enter a node", layer.name.c_str());
            continue;
        }
        if(!current_nodes[layer_index]) {
            enter_node(layer_index, to_node_id(layer.states.front()));
        }
    }
}

void AnimationStateMachine::transition_to(const uint32_t layer_index, const eastl::string_view state_name) {
    if(layer_index >= layers.size()) {
        throw std::out_of_range{"No animation layer with index " + std::to_string(layer_index)};
    }

    const auto& states = layers[layer_index].states;
    const auto itr = eastl::find_if(
        states.begin(),
        states.end(),
        [&](const eastl::string& state) { return eastl::string_view{state.data(), state.size()} == state_name; });
    if(itr == states.end()) {
        throw std::out_of_range{
            "Layer " + std::string{layers[layer_index].name.c_str()} + " has no state named " +
            std::string{state_name.data(), state_name.size()}
        };
    }

    logger->debug("Layer {} transitioning to {}", layers[layer_index].name.c_str(), itr->c_str());

    exit_node(layer_index);
    enter_node(layer_index, to_node_id(*itr));
}

void AnimationStateMachine::stop() {
    for(auto layer_index = 0u; layer_index < layers.size(); layer_index++) {
        exit_node(layer_index);
    }
}

eastl::optional<NodeId> AnimationStateMachine::get_current_node(const uint32_t layer_index) const {
    if(layer_index >= current_nodes.size()) {
        return eastl::nullopt;
    }
    return current_nodes[layer_index];
}

const eastl::vector<AnimationLayer>& AnimationStateMachine::get_layers() const {
    return layers;
}

eastl::vector<eastl::string> AnimationStateMachine::get_node_names() const {
    auto names = eastl::vector<eastl::string>{};
    for(const auto& layer : layers) {
        names.insert(names.end(), layer.states.begin(), layer.states.end());
    }
    return names;
}

eastl::unordered_set<NodeId> AnimationStateMachine::get_node_ids() const {
    auto ids = eastl::unordered_set<NodeId>{};
    for(const auto& layer : layers) {
        for(const auto& state : layer.states) {
            ids.insert(to_node_id(state));
        }
    }
    return ids;
}

void AnimationStateMachine::enter_node(const uint32_t layer_index, const NodeId node) {
    current_nodes[layer_index] = node;

    const auto event = AnimationNodeEvent{.state_machine = this, .node = node, .layer_index = layer_index};
    // Copy the listeners, they may unregister themselves while handling the event
    const auto listeners_copy = listeners;
    for(auto* listener : listeners_copy) {
        listener->on_node_enter(event);
    }
}

void AnimationStateMachine::exit_node(const uint32_t layer_index) {
    const auto node = current_nodes[layer_index];
    if(!node) {
        return;
    }

    current_nodes[layer_index] = eastl::nullopt;

    const auto event = AnimationNodeEvent{.state_machine = this, .node = *node, .layer_index = layer_index};
    const auto listeners_copy = listeners;
    for(auto* listener : listeners_copy) {
        listener->on_node_exit(event);
    }
}
