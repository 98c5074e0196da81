#pragma once

#include <cstdint>

#include <EASTL/optional.h>
#include <EASTL/string.h>
#include <EASTL/vector.h>

#include "animation/animation_node_id.hpp"
#include "resources/resource_path.hpp"

namespace fx {
    /**
     * What to do when a character enters an animation node
     */
    struct NodeEntryEvent {
        /**
         * The name of a node in the character's state machine
         */
        eastl::string node_name;

        /**
         * Hash of node_name, computed when the config is loaded
         */
        NodeId node_id = 0;

        /**
         * Effect to instantiate when we enter the node
         */
        eastl::optional<ResourcePath> effect = eastl::nullopt;

        /**
         * Wait this many seconds before instantiating the effect. If we leave the node before this point, no effect is
         * spawned
         */
        float spawn_delay = 0;

        /**
         * If we leave the node, should we shut down the effect or let it play out? 0 = never cancel. Any other value =
         * we can cancel until this many seconds after entering the node, after that we let it play out. A huge value
         * effectively means "always cancel"
         */
        float abort_deadline = 0;

        /**
         * Sound to play when we enter the node, for sounds that aren't part of the effect
         */
        eastl::optional<ResourcePath> sound = eastl::nullopt;

        /**
         * Seconds before we start playing the sound. If we leave the node before this, no sound plays
         */
        float sound_delay = 0;

        float volume = 1;

        /**
         * Loop the sound for as long as we're in the node
         */
        bool loop = false;

        /**
         * Seconds before we start shaking the camera. If we leave the node before this, the camera does not shake
         */
        float shake_delay = 0;

        /**
         * How long to shake the camera. Once the shake starts it continues for this long even if we leave the node
         */
        float shake_duration = 0;

        float shake_frequency = 0;

        float shake_amplitude = 0;
    };

    /**
     * What to do when a character exits an animation node. These always play once they're triggered
     */
    struct NodeExitEvent {
        eastl::string node_name;

        NodeId node_id = 0;

        eastl::optional<ResourcePath> effect = eastl::nullopt;

        float spawn_delay = 0;

        eastl::optional<ResourcePath> sound = eastl::nullopt;

        float sound_delay = 0;

        float volume = 1;
    };

    /**
     * All the node events for one FX trigger component
     *
     * A character usually has several of these, one for each concern (each class, each weapon, etc)
     */
    struct FxTriggerConfig {
        /**
         * Notes for the artists. Not used by the game
         */
        eastl::string dev_notes;

        /**
         * How many audio channels the character is expected to provide. Only the validator looks at this
         */
        uint32_t audio_channels = 1;

        eastl::vector<NodeEntryEvent> on_node_entry;

        eastl::vector<NodeExitEvent> on_node_exit;
    };
} // fx
