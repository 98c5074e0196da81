#pragma once

#include <EASTL/span.h>
#include <EASTL/string.h>
#include <EASTL/vector.h>

#include "audio/audio_channel.hpp"

namespace audio {
    /**
     * The audio channels that belong to one character
     *
     * Non-looping sounds only ever need one channel - channel 0 - but every looping sound needs a channel of its
     * own. The pool doesn't keep track of who's using which channel, it just asks each channel if it's playing
     */
    class ChannelPool {
    public:
        /**
         * Creates a pool from the character's channels. The pool doesn't own them
         *
         * Throws std::runtime_error if there aren't any channels, or if any of them are null
         */
        explicit ChannelPool(eastl::span<Channel* const> channels_in, eastl::string owner_name_in = "Character");

        /**
         * Retrieves a channel that isn't currently playing anything, or nullptr if all of them are busy
         *
         * This doesn't reserve the channel. Whoever starts playing on it first gets it
         */
        Channel* acquire() const;

        /**
         * The channel that one-shot sounds play on
         */
        Channel& one_shot_channel() const;

        size_t size() const;

    private:
        eastl::vector<Channel*> channels;

        /**
         * Name of the character that owns these channels, for log messages
         */
        eastl::string owner_name;
    };
} // audio
