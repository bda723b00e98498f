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

#ifndef GATECORD_STATE_CACHE_HPP
#define GATECORD_STATE_CACHE_HPP

#include <mutex>                            // std::mutex
#include <unordered_map>                    // std::unordered_map
#include <boost/optional.hpp>               // boost::optional
#include <nlohmann/json.hpp>                // nlohmann::json
#include <gatecord/types/snowflake.hpp>     // Snowflake

namespace Gatecord {
    /**
     *  Minimal local copy of objects received through gateway: current user,
     *  guilds and channels. Objects are stored as raw JSON from Discord.
     *
     *  Thread-safe. Getters return copies.
     */
    class StateCache {
    public:
        using ObjectMap = std::unordered_map<Snowflake, nlohmann::json>;

        StateCache() = default;

        StateCache(const StateCache&) = delete;
        StateCache& operator=(const StateCache&) = delete;

        /**
         *  Take current user and (unavailable) guilds from READY payload.
         */
        void handleReady(const nlohmann::json& readyData);

        /**
         *  Insert or replace guild, channels from "channels" array are
         *  inserted too with guild_id filled in.
         */
        void upsertGuild(const nlohmann::json& guild);

        void upsertChannel(const nlohmann::json& channel);
        void removeChannel(const nlohmann::json& channel);

        /**
         *  null if READY not received yet.
         */
        nlohmann::json currentUser() const;

        boost::optional<nlohmann::json> guild(Snowflake id) const;
        boost::optional<nlohmann::json> channel(Snowflake id) const;

        ObjectMap guilds() const;
        ObjectMap channels() const;

        void clear();
    private:
        // Expects cacheMutex to be locked.
        void storeChannel(const nlohmann::json& channel);

        mutable std::mutex cacheMutex;

        nlohmann::json currentUser_;
        ObjectMap guilds_;
        ObjectMap channels_;
    };
} // namespace Gatecord

#endif // GATECORD_STATE_CACHE_HPP
