#pragma once

#include <EASTL/unique_ptr.h>
#include <EASTL/vector.h>

#include "fx/animator_triggered_fx.hpp"

class AnimationStateMachine;

/**
 * Lives on a character's root entity and holds all of the character's FX trigger components
 *
 * Each trigger has its own config and listens to the character's state machine on its own
 */
struct FxTriggerComponent {
    /**
     * The state machine that all the triggers listen to. Must outlive this component
     */
    AnimationStateMachine* state_machine = nullptr;

    eastl::vector<eastl::unique_ptr<fx::AnimatorTriggeredFx>> triggers;
};
