// Gatecord - Discord API library for C++11 using boost libraries.
// Copyright © 2017 Maks Mazurov (fox.cpp) <foxcpp@yandex.ru>
// 
// Permission is hereby granted, free of charge, to any person obtaining
// a copy of this software and associated documentation files (the "Software"),
// to deal in the Software without restriction, including without limitation
// the rights to use, copy, modify, merge, publish, distribute, sublicense,
// and/or sell copies of the Software, and to permit persons to whom the
// Software is furnished to do so, subject to the following conditions:
// 
// The above copyright notice and this permission notice shall be included
// in all copies or substantial portions of the Software.
// 
// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND,
// EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES
// OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT.
// IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM,
// DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT,
// TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE
// OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.

#include <gatecord/state_cache.hpp>

namespace Gatecord {

void StateCache::handleReady(const nlohmann::json& readyData) {
    std::lock_guard<std::mutex> lock(cacheMutex);

    if (readyData.count("user")) {
        currentUser_ = readyData.at("user");
    }

    if (readyData.count("guilds") && readyData.at("guilds").is_array()) {
        for (const nlohmann::json& guild : readyData.at("guilds")) {
            guilds_[guild.at("id").get<Snowflake>()] = guild;
        }
    }
}

void StateCache::upsertGuild(const nlohmann::json& guild) {
    Snowflake guildId = guild.at("id").get<Snowflake>();

    std::lock_guard<std::mutex> lock(cacheMutex);
    guilds_[guildId] = guild;

    if (guild.count("channels") && guild.at("channels").is_array()) {
        for (nlohmann::json channel : guild.at("channels")) {
            // Channels inside GUILD_CREATE don't have guild_id.
            channel["guild_id"] = guildId;
            storeChannel(channel);
        }
    }
}

void StateCache::upsertChannel(const nlohmann::json& channel) {
    std::lock_guard<std::mutex> lock(cacheMutex);
    storeChannel(channel);
}

void StateCache::removeChannel(const nlohmann::json& channel) {
    Snowflake channelId = channel.at("id").get<Snowflake>();

    std::lock_guard<std::mutex> lock(cacheMutex);
    channels_.erase(channelId);
}

void StateCache::storeChannel(const nlohmann::json& channel) {
    channels_[channel.at("id").get<Snowflake>()] = channel;
}

nlohmann::json StateCache::currentUser() const {
    std::lock_guard<std::mutex> lock(cacheMutex);
    return currentUser_;
}

boost::optional<nlohmann::json> StateCache::guild(Snowflake id) const {
    std::lock_guard<std::mutex> lock(cacheMutex);

    auto it = guilds_.find(id);
    if (it == guilds_.end()) return boost::none;
    return it->second;
}

boost::optional<nlohmann::json> StateCache::channel(Snowflake id) const {
    std::lock_guard<std::mutex> lock(cacheMutex);

    auto it = channels_.find(id);
    if (it == channels_.end()) return boost::none;
    return it->second;
}

StateCache::ObjectMap StateCache::guilds() const {
    std::lock_guard<std::mutex> lock(cacheMutex);
    return guilds_;
}

StateCache::ObjectMap StateCache::channels() const {
    std::lock_guard<std::mutex> lock(cacheMutex);
    return channels_;
}

void StateCache::clear() {
    std::lock_guard<std::mutex> lock(cacheMutex);
    currentUser_ = nullptr;
    guilds_.clear();
    channels_.clear();
}

} // namespace Gatecord
