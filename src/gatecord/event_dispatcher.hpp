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

#ifndef GATECORD_EVENTDISPATCHER_HPP
#define GATECORD_EVENTDISPATCHER_HPP

#include <cstdint>                          // uint64_t
#include <string>                           // std::string
#include <vector>                           // std::vector
#include <utility>                          // std::pair
#include <functional>                       // std::function
#include <mutex>                            // std::mutex
#include <unordered_map>                    // std::unordered_map
#include <boost/asio/thread_pool.hpp>       // boost::asio::thread_pool
#include <nlohmann/json.hpp>                // nlohmann::json

namespace Gatecord {
    /**
     *  Names of events dispatched by \ref GatewayClient.
     *
     *  Gateway event names are lower-cased, so any event not listed here
     *  can be handled using lower-cased name from Discord documentation
     *  (e.g. "auto_moderation_rule_create").
     */
    namespace Event {
        constexpr const char* Ready                    = "ready";
        constexpr const char* Resumed                  = "resumed";
        constexpr const char* ChannelCreate            = "channel_create";
        constexpr const char* ChannelUpdate            = "channel_update";
        constexpr const char* ChannelDelete            = "channel_delete";
        constexpr const char* ChannelPinsUpdate        = "channel_pins_update";
        constexpr const char* GuildCreate              = "guild_create";
        constexpr const char* GuildUpdate              = "guild_update";
        constexpr const char* GuildDelete              = "guild_delete";
        constexpr const char* GuildBanAdd              = "guild_ban_add";
        constexpr const char* GuildBanRemove           = "guild_ban_remove";
        constexpr const char* GuildMemberAdd           = "guild_member_add";
        constexpr const char* GuildMemberRemove        = "guild_member_remove";
        constexpr const char* GuildMemberUpdate        = "guild_member_update";
        constexpr const char* GuildMembersChunk        = "guild_members_chunk";
        constexpr const char* GuildRoleCreate          = "guild_role_create";
        constexpr const char* GuildRoleUpdate          = "guild_role_update";
        constexpr const char* GuildRoleDelete          = "guild_role_delete";
        constexpr const char* MessageCreate            = "message_create";
        constexpr const char* MessageUpdate            = "message_update";
        constexpr const char* MessageDelete            = "message_delete";
        constexpr const char* MessageDeleteBulk        = "message_delete_bulk";
        constexpr const char* MessageReactionAdd       = "message_reaction_add";
        constexpr const char* MessageReactionRemove    = "message_reaction_remove";
        constexpr const char* MessageReactionRemoveAll = "message_reaction_remove_all";
        constexpr const char* PresenceUpdate           = "presence_update";
        constexpr const char* TypingStart              = "typing_start";
        constexpr const char* UserUpdate               = "user_update";
        constexpr const char* VoiceStateUpdate         = "voice_state_update";
        constexpr const char* VoiceServerUpdate        = "voice_server_update";
        constexpr const char* WebhooksUpdate           = "webhooks_update";
    }

    /**
     *  Thread-safe mapping from event name to list of handlers.
     *
     *  Handlers are executed on dispatcher's own thread pool, each invocation
     *  independently: exception thrown by one handler is logged and doesn't
     *  affect other handlers or caller of \ref dispatchEvent.
     *
     *  Event names are case-insensitive.
     */
    class EventDispatcher {
    public:
        using EventHandler = std::function<void(const nlohmann::json&)>;
        using HandlerId    = uint64_t;

        /**
         *  \param threads Count of threads used to execute handlers.
         */
        explicit EventDispatcher(std::size_t threads = 4);

        /**
         *  Waits for running handlers to finish.
         */
        ~EventDispatcher();

        EventDispatcher(const EventDispatcher&) = delete;
        EventDispatcher& operator=(const EventDispatcher&) = delete;

        /**
         *  Register handler for event, multiple handlers per event allowed.
         *
         *  \returns ID that can be passed to \ref removeHandler.
         *  \throws InvalidParameter if handler is empty.
         */
        HandlerId addHandler(const std::string& eventName, EventHandler handler);

        /**
         *  Remove single handler. Returns false if there is no such handler.
         */
        bool removeHandler(const std::string& eventName, HandlerId id);

        /**
         *  Remove all handlers for event.
         */
        void removeHandlers(const std::string& eventName);

        /**
         *  Remove all handlers.
         */
        void clear();

        /**
         *  Schedule all handlers for event, returns without waiting for them.
         *  Does nothing if there is no handlers for this event.
         */
        void dispatchEvent(const std::string& eventName, const nlohmann::json& payload);

        /**
         *  Names of events with at least one handler.
         */
        std::vector<std::string> events() const;

        std::size_t handlersCount(const std::string& eventName) const;

        /**
         *  Wait for scheduled and running handlers to finish. Handlers
         *  dispatched after this call are never executed.
         *
         *  \warning Should not be called from handler, it will deadlock.
         */
        void join();
    private:
        using HandlerList = std::vector<std::pair<HandlerId, EventHandler> >;

        mutable std::mutex handlersMutex;
        std::unordered_map<std::string, HandlerList> handlers;
        HandlerId nextId = 1;

        boost::asio::thread_pool workers;
    };
} // namespace Gatecord

#endif // GATECORD_EVENTDISPATCHER_HPP
