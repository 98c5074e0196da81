#include "audio_channel_pool.hpp"

#include <stdexcept>

#include <EASTL/algorithm.h>
#include <spdlog/spdlog.h>

#include "core/system_interface.hpp"

static std::shared_ptr<spdlog::logger> logger;

namespace audio {
    ChannelPool::ChannelPool(const eastl::span<Channel* const> channels_in, eastl::string owner_name_in) :
        channels{channels_in.begin(), channels_in.end()}, owner_name{eastl::move(owner_name_in)} {
        if(logger == nullptr) {
            logger = SystemInterface::get().get_logger("AudioChannelPool");
        }

        if(channels.empty()) {
            logger->error("{} has no audio channels!", owner_name.c_str());
            throw std::runtime_error{"An audio channel pool needs at least one channel"};
        }
        if(eastl::find(channels.begin(), channels.end(), nullptr) != channels.end()) {
            logger->error("{} has a null audio channel!", owner_name.c_str());
            throw std::runtime_error{"Audio channels may not be null"};
        }
    }

    Channel* ChannelPool::acquire() const {
        for(auto* channel : channels) {
            if(!channel->is_playing()) {
                return channel;
            }
        }

        logger->warn(
            "{} doesn't have enough audio channels to loop all desired sound effects. (Have {}, need at least 1 more)",
            owner_name.c_str(),
            channels.size());
        return nullptr;
    }

    Channel& ChannelPool::one_shot_channel() const {
        return *channels.front();
    }

    size_t ChannelPool::size() const {
        return channels.size();
    }
} // audio
