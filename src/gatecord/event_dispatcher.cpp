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

#include <gatecord/event_dispatcher.hpp>
#include <iostream>
#include <memory>                               // std::shared_ptr
#include <boost/asio/post.hpp>                  // boost::asio::post
#include <gatecord/exceptions.hpp>
#include <gatecord/internal/utils.hpp>          // Utils::stringToLower

#define ERROR_MSG(msg) do { std::cerr <<  "event_dispatcher.cpp:" << __LINE__ << " " << (msg) << '\n'; } while (false)

namespace Gatecord {
    EventDispatcher::EventDispatcher(std::size_t threads)
        : workers(threads == 0 ? 1 : threads) {}

    EventDispatcher::~EventDispatcher() {
        workers.join();
    }

    void EventDispatcher::join() {
        workers.join();
    }

    EventDispatcher::HandlerId EventDispatcher::addHandler(const std::string& eventName, EventDispatcher::EventHandler handler) {
        if (!handler) {
            throw InvalidParameter("handler", "empty handler passed for event " + eventName + ".");
        }

        std::lock_guard<std::mutex> lock(handlersMutex);
        HandlerId id = nextId++;
        handlers[Utils::stringToLower(eventName)].emplace_back(id, std::move(handler));
        return id;
    }

    bool EventDispatcher::removeHandler(const std::string& eventName, EventDispatcher::HandlerId id) {
        std::lock_guard<std::mutex> lock(handlersMutex);

        auto listIt = handlers.find(Utils::stringToLower(eventName));
        if (listIt == handlers.end()) return false;

        HandlerList& list = listIt->second;
        for (auto it = list.begin(); it != list.end(); ++it) {
            if (it->first == id) {
                list.erase(it);
                if (list.empty()) handlers.erase(listIt);
                return true;
            }
        }
        return false;
    }

    void EventDispatcher::removeHandlers(const std::string& eventName) {
        std::lock_guard<std::mutex> lock(handlersMutex);
        handlers.erase(Utils::stringToLower(eventName));
    }

    void EventDispatcher::clear() {
        std::lock_guard<std::mutex> lock(handlersMutex);
        handlers.clear();
    }

    void EventDispatcher::dispatchEvent(const std::string& eventName, const nlohmann::json& payload) {
        std::string name = Utils::stringToLower(eventName);

        HandlerList toRun;
        {
            std::lock_guard<std::mutex> lock(handlersMutex);
            auto it = handlers.find(name);
            if (it == handlers.end()) return;
            toRun = it->second;
        }

        // Single copy of payload shared by all invocations.
        auto sharedPayload = std::make_shared<const nlohmann::json>(payload);
        for (const auto& entry : toRun) {
            EventHandler handler = entry.second;
            boost::asio::post(workers, [name, handler, sharedPayload]() {
                try {
                    handler(*sharedPayload);
                } catch (std::exception& excp) {
                    ERROR_MSG(std::string("Exception in handler for event ") + name + ": " + excp.what());
                } catch (...) {
                    ERROR_MSG(std::string("Unknown exception in handler for event ") + name);
                }
            });
        }
    }

    std::vector<std::string> EventDispatcher::events() const {
        std::lock_guard<std::mutex> lock(handlersMutex);

        std::vector<std::string> result;
        result.reserve(handlers.size());
        for (const auto& pair : handlers) {
            result.push_back(pair.first);
        }
        return result;
    }

    std::size_t EventDispatcher::handlersCount(const std::string& eventName) const {
        std::lock_guard<std::mutex> lock(handlersMutex);

        auto it = handlers.find(Utils::stringToLower(eventName));
        return it == handlers.end() ? 0 : it->second.size();
    }
} // namespace Gatecord
