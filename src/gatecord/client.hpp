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

#ifndef GATECORD_CLIENT_HPP
#define GATECORD_CLIENT_HPP

#include <string>                               // std::string
#include <memory>                               // std::shared_ptr
#include <boost/asio/io_service.hpp>            // boost::asio::io_service
#include <nlohmann/json.hpp>                    // nlohmann::json
#include <gatecord/intents.hpp>                 // Intents
#include <gatecord/event_dispatcher.hpp>        // EventDispatcher
#include <gatecord/state_cache.hpp>             // StateCache
#include <gatecord/rest_client.hpp>             // RestClient
#include <gatecord/gateway_client.hpp>          // GatewayClient, GatewayConfig

/**
 * \file client.hpp
 *  Defines \ref Gatecord::Client class.
 */

namespace Gatecord {
    /**
     *  Bot client, wraps REST caller and gateway connection sharing
     *  one event dispatcher and cache.
     *
     *  Most basic bot would look like this (Gatecord namespace omitted):
     *  ```cpp
     *      boost::asio::io_service ios;
     *      Client client(ios, "TTTTTOOOOOOOOKKKKKEEEEEENNNNN",
     *                    { Intent::GuildMessages, Intent::MessageContent });
     *
     *      // register your handlers here.
     *      client.on(Event::MessageCreate, [](const nlohmann::json& message) {
     *          // do stuff...
     *      });
     *
     *      client.run();
     *      ios.run();
     *  ```
     *
     *  Handlers are executed on dispatcher's thread pool, not on ioService
     *  threads, so they can use blocking \ref RestClient::sendRestRequest.
     */
    class Client {
    public:
        /**
         *  Construct Client, does nothing network-related.
         *
         *  \param ioService ASIO I/O service. Should not be destroyed while
         *                   Client exists.
         *  \param token     bot token, without "Bot " prefix.
         *  \param intents   gateway intents, overrides config.intents.
         *  \param config    other gateway parameters, config.token is ignored.
         *
         *  \throws InvalidParameter if token is empty.
         */
        Client(boost::asio::io_service& ioService, const std::string& token,
               Intents intents = Intents(), GatewayConfig config = GatewayConfig(),
               SocketFactory socketFactory = makeTLSWebSocket,
               std::shared_ptr<BackoffPolicy> backoff = std::make_shared<JitteredBackoff>());

        /**
         *  Close gateway connection and wait for running event handlers,
         *  so handlers can use client members until they return.
         *
         *  ioService should not be running handlers for this client anymore,
         *  stop it first if it runs in other threads. Should not be called
         *  from event handler.
         */
        ~Client();

        Client(const Client&) = delete;
        Client& operator=(const Client&) = delete;

        /**
         *  Start gateway connection, returns immediately.
         */
        void run();

        /**
         *  Disconnect from gateway. Idempotent.
         */
        void stop() noexcept;

        /**
         *  Whether gateway session is established (READY or RESUMED received).
         */
        bool ready() const;

        /**
         *  Shorthand for eventDispatcher.addHandler.
         */
        EventDispatcher::HandlerId on(const std::string& eventName, EventDispatcher::EventHandler handler);

        /**
         *  \sa \ref GatewayClient::updatePresence
         */
        void updatePresence(const std::string& status = "online", const nlohmann::json& activity = nullptr);

        nlohmann::json currentUser() const;
        StateCache::ObjectMap guilds() const;
        StateCache::ObjectMap channels() const;

        // Declaration order matters: gateway uses dispatcher and cache.
        EventDispatcher eventDispatcher;
        StateCache cache;
        RestClient rest;
        GatewayClient gateway;
    private:
        static GatewayConfig makeConfig(const std::string& token, Intents intents, GatewayConfig config);
    };
} // namespace Gatecord

#endif // GATECORD_CLIENT_HPP
