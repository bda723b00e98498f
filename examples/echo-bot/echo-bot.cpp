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

#include <cstdlib>
#include <iostream>
#include <mutex>
#include <unordered_map>
#include <boost/asio/io_service.hpp>
#include <gatecord/client.hpp>
#include <gatecord/exceptions.hpp>

int main(int argc, char** argv) {
    const char* botToken = std::getenv("BOT_TOKEN");
    if (!botToken) {
        std::cerr << "Set bot token using BOT_TOKEN enviroment variable.\n"
                  << "E.g. env BOT_TOKEN=token_here " << argv[0] << '\n';
        return 1;
    }

    const char* ownerIdStr = std::getenv("OWNER_ID");
    if (!ownerIdStr) {
        std::cerr << "OWNER_ID is not set, echo-bot shutdown can't be used.\n";
    }
    Gatecord::Snowflake ownerId = ownerIdStr ? Gatecord::Snowflake(ownerIdStr) : Gatecord::Snowflake();

    boost::asio::io_service ioService;

    // We also set status to "Playing echo-bot turn-on".
    Gatecord::GatewayConfig config;
    config.initialPresence = {
        { "since", nullptr },
        { "status", "online" },
        { "activities", {{ { "name", "echo-bot turn-on" }, { "type", 0 } }} },
        { "afk", false }
    };

    Gatecord::Client client(ioService, botToken,
                            { Gatecord::Intent::GuildMessages,
                              Gatecord::Intent::DirectMessages,
                              Gatecord::Intent::MessageContent },
                            config);

    // Handlers are executed in parallel.
    std::mutex switchFlagsMutex;
    std::unordered_map<Gatecord::Snowflake, bool> switchFlags;

    auto sendTextMessage = [&client](Gatecord::Snowflake channelId, const std::string& text) {
        client.rest.sendRestRequest("POST", std::string("/channels/") + std::to_string(channelId) + "/messages",
                                    {{ "content", text }});
    };

    client.on(Gatecord::Event::Ready, [&client](const nlohmann::json& json) {
        std::cerr << "Logged in as " << json["user"]["username"].get<std::string>()
                  << ", guilds: " << client.guilds().size() << '\n';
    });

    client.on(Gatecord::Event::MessageCreate, [&](const nlohmann::json& json) {
        Gatecord::Snowflake messageId = json["id"].get<Gatecord::Snowflake>();
        Gatecord::Snowflake channelId = json["channel_id"].get<Gatecord::Snowflake>();

        // Sender can be webhook. For such we need to use "webhook_id" instead of "id".
        Gatecord::Snowflake senderId = json["author"].count("id") ? json["author"]["id"].get<Gatecord::Snowflake>()
                                                                  : json.at("webhook_id").get<Gatecord::Snowflake>();

        // Avoid responding to messages of bot.
        nlohmann::json me = client.currentUser();
        if (!me.is_null() && senderId == me["id"].get<Gatecord::Snowflake>()) return;

        std::string text = json["content"];

        std::string messageInfo =
            std::string("Message ID: `") + std::to_string(messageId) +
                      "`\nChannel ID: `"  + std::to_string(channelId) +
                      "`\nSender ID: `"   + std::to_string(senderId)  + "`\n" +
                      "\n" + text + "\n\n";

        std::cout << messageInfo;

        bool switchFlag;
        {
            std::lock_guard<std::mutex> lock(switchFlagsMutex);
            bool& storedFlag = switchFlags[channelId];

            if (text == "echo-bot turn-on") {
                if (storedFlag) {
                    sendTextMessage(channelId, "Already turned on.");
                    return;
                }

                std::cerr << "Turning on for channel " << channelId << '\n';
                storedFlag = true;
                sendTextMessage(channelId, "Turned on. Use `echo-bot turn-off` to turn off.");
                return;
            }

            if (text == "echo-bot turn-off") {
                if (!storedFlag) {
                    sendTextMessage(channelId, "Already turned off.");
                    return;
                }
                std::cerr << "Turning off for channel " << channelId << '\n';
                storedFlag = false;
                sendTextMessage(channelId, "Turned off. Use `echo-bot turn-on` to turn on.");
                return;
            }
            switchFlag = storedFlag;
        }

        if (text == "echo-bot shutdown") {
            if (senderId == ownerId) {
                sendTextMessage(channelId, "Goodbye!");
                client.stop();
                ioService.stop();
            } else {
                sendTextMessage(channelId, "Only my owner can use this command.");
            }
            return;
        }

        if (switchFlag) {
            try {
                sendTextMessage(channelId, messageInfo);
            } catch (Gatecord::RatelimitHit& excp) {
                std::cerr << "Can't echo, ratelimited for " << excp.retryAfter << " s.\n";
            }
        }
    });

    client.run();

    /// Run for undetermined amount of time.
    ioService.run();
}
