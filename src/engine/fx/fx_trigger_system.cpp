#include "fx_trigger_system.hpp"

#include <stdexcept>

#include <spdlog/spdlog.h>
#include <tracy/Tracy.hpp>

#include "animation/animation_state_machine.hpp"
#include "core/system_interface.hpp"
#include "fx/fx_trigger_component.hpp"

static std::shared_ptr<spdlog::logger> logger;

FxTriggerSystem::FxTriggerSystem(entt::registry& registry_in, const float poll_interval_in) :
    registry{registry_in}, poll_interval{poll_interval_in} {
    if(logger == nullptr) {
        logger = SystemInterface::get().get_logger("FxTriggerSystem");
    }

    registry.on_destroy<FxTriggerComponent>().connect<&FxTriggerSystem::on_fx_trigger_destroyed>(this);
}

FxTriggerSystem::~FxTriggerSystem() {
    registry.on_destroy<FxTriggerComponent>().disconnect<&FxTriggerSystem::on_fx_trigger_destroyed>(this);
}

fx::AnimatorTriggeredFx& FxTriggerSystem::add_fx_trigger(
    const entt::handle character, AnimationStateMachine& state_machine, fx::FxTriggerConfig config,
    fx::FxCollaborators collaborators
    ) {
    auto& component = character.get_or_emplace<FxTriggerComponent>();
    if(component.state_machine == nullptr) {
        component.state_machine = &state_machine;
    } else if(component.state_machine != &state_machine) {
        logger->error(
            "Entity {} already listens to a different state machine",
            static_cast<uint32_t>(character.entity()));
        throw std::runtime_error{"A character's FX triggers must all listen to the same state machine"};
    }

    collaborators.state_machine = &state_machine;
    collaborators.anchor = character;

    logger->debug(
        "Adding FX trigger with {} entry and {} exit events to entity {}",
        config.on_node_entry.size(),
        config.on_node_exit.size(),
        static_cast<uint32_t>(character.entity()));

    auto& trigger = component.triggers.emplace_back(
        eastl::make_unique<fx::AnimatorTriggeredFx>(eastl::move(config), collaborators, poll_interval));
    state_machine.add_listener(trigger.get());

    return *trigger;
}

void FxTriggerSystem::tick(const float delta_time) {
    ZoneScopedN("FxTriggerSystem::tick");

    registry.view<FxTriggerComponent>().each(
        [&](FxTriggerComponent& component) {
            for(auto& trigger : component.triggers) {
                trigger->tick(delta_time);
            }
        });
}

size_t FxTriggerSystem::num_running_tasks() const {
    auto num_tasks = size_t{0};
    registry.view<FxTriggerComponent>().each(
        [&](const FxTriggerComponent& component) {
            for(const auto& trigger : component.triggers) {
                num_tasks += trigger->num_running_tasks();
            }
        });
    return num_tasks;
}

void FxTriggerSystem::on_fx_trigger_destroyed(entt::registry& registry, const entt::entity entity) {
    auto& component = registry.get<FxTriggerComponent>(entity);
    if(component.state_machine == nullptr) {
        return;
    }

    for(auto& trigger : component.triggers) {
        component.state_machine->remove_listener(trigger.get());
    }
}
