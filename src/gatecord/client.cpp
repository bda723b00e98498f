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

#include <gatecord/client.hpp>
#include <gatecord/exceptions.hpp>

namespace Gatecord {
    GatewayConfig Client::makeConfig(const std::string& token, Intents intents, GatewayConfig config) {
        if (token.empty()) {
            throw InvalidParameter("token", "token should not be empty.");
        }

        config.token   = token;
        config.intents = intents;
        return config;
    }

    Client::Client(boost::asio::io_service& ioService, const std::string& token,
                   Intents intents, GatewayConfig config,
                   SocketFactory socketFactory, std::shared_ptr<BackoffPolicy> backoff)
        : rest(ioService, token)
        , gateway(ioService, makeConfig(token, intents, std::move(config)), eventDispatcher, cache,
                  std::move(socketFactory), std::move(backoff)) {}

    Client::~Client() {
        gateway.disconnect();
        eventDispatcher.join();
    }

    void Client::run() {
        gateway.connect();
    }

    void Client::stop() noexcept {
        gateway.disconnect();
    }

    bool Client::ready() const {
        return gateway.ready();
    }

    EventDispatcher::HandlerId Client::on(const std::string& eventName, EventDispatcher::EventHandler handler) {
        return eventDispatcher.addHandler(eventName, std::move(handler));
    }

    void Client::updatePresence(const std::string& status, const nlohmann::json& activity) {
        gateway.updatePresence(status, activity);
    }

    nlohmann::json Client::currentUser() const {
        return cache.currentUser();
    }

    StateCache::ObjectMap Client::guilds() const {
        return cache.guilds();
    }

    StateCache::ObjectMap Client::channels() const {
        return cache.channels();
    }
} // namespace Gatecord
