#pragma once

#include <EASTL/shared_ptr.h>
#include <entt/entity/handle.hpp>

#include "fx/special_fx_graphic.hpp"
#include "resources/resource_path.hpp"

namespace fx {
    /**
     * Creates visual effects in the world
     */
    class EffectSpawner {
    public:
        virtual ~EffectSpawner() = default;

        /**
         * Instantiates the effect and parents it to the anchor entity
         *
         * The spawner keeps the effect alive until it finishes. Callers that only want to watch the effect should hold
         * on to a weak pointer
         */
        virtual eastl::shared_ptr<SpecialFxGraphic> instantiate(const ResourcePath& effect, entt::handle anchor) = 0;
    };
} // fx
