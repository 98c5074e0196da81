#pragma once

#include "resources/resource_path.hpp"

namespace audio {
    /**
     * An audio output that can play one sound at a time
     *
     * One-shots are mixed on top of whatever the channel is doing. Looping sounds take the channel over until
     * they're stopped
     */
    class Channel {
    public:
        virtual ~Channel() = default;

        /**
         * Plays a clip once, at the given volume. Does not change the channel's clip, loop flag, or volume
         */
        virtual void play_one_shot(const ResourcePath& clip, float volume) = 0;

        virtual void set_volume(float volume) = 0;

        virtual void set_loop(bool loop) = 0;

        virtual void set_clip(const ResourcePath& clip) = 0;

        /**
         * Starts playing the channel's clip
         */
        virtual void play() = 0;

        virtual bool is_playing() const = 0;

        virtual void stop() = 0;
    };
} // audio
