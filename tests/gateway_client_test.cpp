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

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <vector>
#include <gtest/gtest.h>
#include <boost/asio/io_service.hpp>
#include <gatecord/gateway_client.hpp>
#include <gatecord/exceptions.hpp>
#include "fake_socket.hpp"

using namespace Gatecord;
using Gatecord::Testing::FakeSocket;

namespace {
    // Collects payloads delivered to one event handler.
    class EventRecorder {
    public:
        void record(const nlohmann::json& payload) {
            std::lock_guard<std::mutex> lock(mutex);
            payloads.push_back(payload);
            cv.notify_all();
        }

        bool waitFor(std::size_t count, std::chrono::milliseconds timeout = std::chrono::milliseconds(2000)) {
            std::unique_lock<std::mutex> lock(mutex);
            return cv.wait_for(lock, timeout, [this, count]() { return payloads.size() >= count; });
        }

        std::vector<nlohmann::json> received() {
            std::lock_guard<std::mutex> lock(mutex);
            return payloads;
        }
    private:
        std::mutex mutex;
        std::condition_variable cv;
        std::vector<nlohmann::json> payloads;
    };
}

class GatewayClientTest : public ::testing::Test {
protected:
    void SetUp() override {
        config.token   = "TOKEN";
        config.intents = Intents({ Intent::Guilds, Intent::GuildMessages });
    }

    void makeClient() {
        client.reset(new GatewayClient(ios, config, dispatcher, cache,
            [this](boost::asio::io_service&) -> std::shared_ptr<GatewaySocket> {
                auto socket = std::make_shared<FakeSocket>();
                sockets.push_back(socket);
                return socket;
            }, std::make_shared<FixedBackoff>(backoffDelay)));
    }

    void drain(std::chrono::milliseconds duration = std::chrono::milliseconds(30)) {
        ios.restart();
        ios.run_for(duration);
    }

    FakeSocket& socket() {
        return *sockets.back();
    }

    void hello(unsigned interval = 41250) {
        socket().receive({{ "op", 10 }, { "d", {{ "heartbeat_interval", interval }} }});
        drain();
    }

    void openAndHello(unsigned interval = 41250) {
        drain();
        socket().simulateOpen();
        drain();
        hello(interval);
    }

    void dispatch(const std::string& name, int64_t seq, const nlohmann::json& data) {
        socket().receive({{ "op", 0 }, { "s", seq }, { "t", name }, { "d", data }});
        drain();
    }

    void ready(const std::string& sessionId = "session-1", int64_t seq = 1) {
        dispatch("READY", seq, {
            { "session_id", sessionId },
            { "resume_gateway_url", "wss://resume.discord.gg" },
            { "user", {{ "id", "100" }, { "username", "bot" }} },
            { "guilds", {{{ "id", "200" }, { "unavailable", true }}} }
        });
    }

    void connectReady() {
        makeClient();
        client->connect();
        openAndHello();
        ready();
    }

    boost::asio::io_service ios;
    GatewayConfig config;
    std::chrono::milliseconds backoffDelay{0};
    EventDispatcher dispatcher{2};
    StateCache cache;
    std::vector<std::shared_ptr<FakeSocket> > sockets;
    std::unique_ptr<GatewayClient> client;
};

TEST_F(GatewayClientTest, RejectsEmptyToken) {
    config.token.clear();
    EXPECT_THROW(makeClient(), InvalidParameter);
}

TEST_F(GatewayClientTest, ConnectOpensVersionedUrl) {
    makeClient();
    client->connect();
    drain();

    ASSERT_EQ(sockets.size(), 1u);
    EXPECT_TRUE(socket().openCalled);
    EXPECT_EQ(socket().url, "wss://gateway.discord.gg/?v=10&encoding=json");
    EXPECT_EQ(client->state(), GatewayState::Connecting);

    socket().simulateOpen();
    drain();
    EXPECT_EQ(client->state(), GatewayState::AwaitingHello);
}

TEST_F(GatewayClientTest, TransportCompressionAddsQueryParameter) {
    config.transportCompression = true;
    makeClient();
    client->connect();
    drain();

    EXPECT_EQ(socket().url, "wss://gateway.discord.gg/?v=10&encoding=json&compress=zlib-stream");
}

TEST_F(GatewayClientTest, HelloWithoutSessionSendsIdentify) {
    config.shardId    = 1;
    config.shardCount = 4;
    makeClient();
    client->connect();
    openAndHello();

    EXPECT_EQ(client->state(), GatewayState::Identifying);
    EXPECT_EQ(client->heartbeatIntervalMs(), 41250u);

    auto identifies = socket().sentWithOpcode(OpCode::Identify);
    ASSERT_EQ(identifies.size(), 1u);

    const nlohmann::json& d = identifies[0]["d"];
    EXPECT_EQ(d["token"], "TOKEN");
    EXPECT_EQ(d["intents"].get<uint32_t>(), uint32_t(Intent::Guilds | Intent::GuildMessages));
    EXPECT_EQ(d["properties"]["browser"], "gatecord");
    EXPECT_EQ(d["properties"]["device"], "gatecord");
    EXPECT_TRUE(d["properties"]["os"].is_string());
    EXPECT_EQ(d["large_threshold"], 250);
    EXPECT_EQ(d["shard"], nlohmann::json({ 1, 4 }));
    EXPECT_EQ(d.count("presence"), 0u);
    EXPECT_TRUE(socket().sentWithOpcode(OpCode::Resume).empty());
}

TEST_F(GatewayClientTest, FirstHeartbeatWaitsFullInterval) {
    makeClient();
    client->connect();
    openAndHello(41250);

    drain(std::chrono::milliseconds(100));
    EXPECT_TRUE(socket().sentWithOpcode(OpCode::Heartbeat).empty());
}

TEST_F(GatewayClientTest, ReadyRecordsSessionAndFiresEvent) {
    EventRecorder readyEvents;
    dispatcher.addHandler(Event::Ready, [&readyEvents](const nlohmann::json& payload) {
        readyEvents.record(payload);
    });

    connectReady();

    EXPECT_TRUE(client->ready());
    EXPECT_EQ(client->state(), GatewayState::Connected);
    ASSERT_TRUE(client->sessionId());
    EXPECT_EQ(*client->sessionId(), "session-1");
    ASSERT_TRUE(client->sequence());
    EXPECT_EQ(*client->sequence(), 1);

    EXPECT_EQ(cache.currentUser()["username"], "bot");
    EXPECT_TRUE(cache.guild(200));

    ASSERT_TRUE(readyEvents.waitFor(1));
    EXPECT_EQ(readyEvents.received()[0]["session_id"], "session-1");
}

TEST_F(GatewayClientTest, DispatchAdvancesSequenceAndFiresLowerCasedName) {
    EventRecorder messages;
    dispatcher.addHandler(Event::MessageCreate, [&messages](const nlohmann::json& payload) {
        messages.record(payload);
    });

    connectReady();
    dispatch("GUILD_UPDATE", 5, {{ "id", "999" }});
    ASSERT_EQ(*client->sequence(), 5);

    auto guildsBefore   = cache.guilds();
    auto channelsBefore = cache.channels();

    dispatch("MESSAGE_CREATE", 7, {{ "content", "hello" }, { "channel_id", "300" }});

    EXPECT_EQ(*client->sequence(), 7);
    ASSERT_TRUE(messages.waitFor(1));
    EXPECT_EQ(messages.received()[0]["content"], "hello");

    EXPECT_EQ(cache.guilds().size(), guildsBefore.size());
    EXPECT_EQ(cache.channels().size(), channelsBefore.size());
}

TEST_F(GatewayClientTest, SequenceNeverRegresses) {
    connectReady();

    dispatch("TYPING_START", 10, nlohmann::json::object());
    dispatch("TYPING_START", 10, nlohmann::json::object());
    dispatch("TYPING_START", 4, nlohmann::json::object());

    EXPECT_EQ(*client->sequence(), 10);
}

TEST_F(GatewayClientTest, UnknownEventsPassThrough) {
    EventRecorder unknown;
    dispatcher.addHandler("some_future_event", [&unknown](const nlohmann::json& payload) {
        unknown.record(payload);
    });

    connectReady();
    dispatch("SOME_FUTURE_EVENT", 2, {{ "x", 1 }});

    ASSERT_TRUE(unknown.waitFor(1));
    EXPECT_EQ(unknown.received()[0]["x"], 1);
}

TEST_F(GatewayClientTest, ChannelEventsUpdateCache) {
    connectReady();

    dispatch("GUILD_CREATE", 2, {
        { "id", "200" },
        { "name", "guild" },
        { "channels", {{{ "id", "300" }, { "name", "general" }}} }
    });
    ASSERT_TRUE(cache.channel(300));
    EXPECT_EQ((*cache.channel(300))["guild_id"], "200");

    dispatch("CHANNEL_UPDATE", 3, {{ "id", "300" }, { "name", "renamed" }});
    EXPECT_EQ((*cache.channel(300))["name"], "renamed");

    dispatch("CHANNEL_DELETE", 4, {{ "id", "300" }});
    EXPECT_FALSE(cache.channel(300));
}

TEST_F(GatewayClientTest, MalformedFramesAreDropped) {
    connectReady();
    std::size_t socketsBefore = sockets.size();

    GatewayFrame garbage;
    std::string text = "{not json";
    garbage.bytes.assign(text.begin(), text.end());
    socket().receive(garbage);
    drain();

    // READY without session_id: bad field, frame dropped without state change.
    socket().receive({{ "op", 0 }, { "s", 9 }, { "t", "READY" }, { "d", nullptr }});
    drain();

    EXPECT_EQ(sockets.size(), socketsBefore);
    EXPECT_TRUE(client->ready());
    EXPECT_EQ(*client->sessionId(), "session-1");
}

TEST_F(GatewayClientTest, HeartbeatCarriesSequenceAndTimeoutReconnects) {
    makeClient();
    client->connect();
    openAndHello(200);
    ready("session-1", 3);

    drain(std::chrono::milliseconds(200));
    auto heartbeats = socket().sentWithOpcode(OpCode::Heartbeat);
    ASSERT_EQ(heartbeats.size(), 1u);
    EXPECT_EQ(heartbeats[0]["d"], 3);

    // No ack: next tick drops connection and opens a new one.
    drain(std::chrono::milliseconds(250));
    ASSERT_EQ(sockets.size(), 2u);
    EXPECT_EQ(sockets[0]->closeCode, 4000);
    EXPECT_EQ(sockets[0]->sentWithOpcode(OpCode::Heartbeat).size(), 1u);
    EXPECT_FALSE(client->ready());

    // Session is preserved, so hello on new connection resumes.
    socket().simulateOpen();
    drain();
    hello();
    auto resumes = socket().sentWithOpcode(OpCode::Resume);
    ASSERT_EQ(resumes.size(), 1u);
    EXPECT_EQ(resumes[0]["d"]["session_id"], "session-1");
    EXPECT_EQ(resumes[0]["d"]["seq"], 3);
    EXPECT_EQ(socket().url, "wss://resume.discord.gg/?v=10&encoding=json");
}

TEST_F(GatewayClientTest, AcknowledgedHeartbeatsContinue) {
    makeClient();
    client->connect();
    openAndHello(200);

    drain(std::chrono::milliseconds(250));
    ASSERT_EQ(socket().sentWithOpcode(OpCode::Heartbeat).size(), 1u);
    // Sent before first dispatch.
    EXPECT_TRUE(socket().sentWithOpcode(OpCode::Heartbeat)[0]["d"].is_null());

    socket().receive({{ "op", 11 }});
    drain(std::chrono::milliseconds(180));

    EXPECT_EQ(sockets.size(), 1u);
    EXPECT_EQ(socket().sentWithOpcode(OpCode::Heartbeat).size(), 2u);
}

TEST_F(GatewayClientTest, ServerHeartbeatRequestIsAnswered) {
    connectReady();

    socket().receive({{ "op", 1 }, { "d", nullptr }});
    drain();

    auto heartbeats = socket().sentWithOpcode(OpCode::Heartbeat);
    ASSERT_EQ(heartbeats.size(), 1u);
    EXPECT_EQ(heartbeats[0]["d"], 1);
}

TEST_F(GatewayClientTest, ResumableInvalidSessionResumesImmediately) {
    connectReady();
    dispatch("TYPING_START", 6, nlohmann::json::object());

    socket().receive({{ "op", 9 }, { "d", true }});
    drain();

    auto resumes = socket().sentWithOpcode(OpCode::Resume);
    ASSERT_EQ(resumes.size(), 1u);
    EXPECT_EQ(resumes[0]["d"]["session_id"], "session-1");
    EXPECT_EQ(resumes[0]["d"]["seq"], 6);
    EXPECT_EQ(client->state(), GatewayState::Resuming);
}

TEST_F(GatewayClientTest, NonResumableInvalidSessionIdentifiesAgain) {
    connectReady();
    ASSERT_EQ(socket().sentWithOpcode(OpCode::Identify).size(), 1u);

    socket().receive({{ "op", 9 }, { "d", false }});
    drain();

    EXPECT_FALSE(client->sessionId());
    EXPECT_FALSE(client->sequence());
    EXPECT_EQ(sockets.size(), 1u);
    EXPECT_EQ(socket().sentWithOpcode(OpCode::Identify).size(), 2u);
    EXPECT_TRUE(socket().sentWithOpcode(OpCode::Resume).empty());
}

TEST_F(GatewayClientTest, NonResumableInvalidSessionWaitsBeforeIdentify) {
    backoffDelay = std::chrono::milliseconds(200);
    connectReady();

    socket().receive({{ "op", 9 }, { "d", false }});
    drain(std::chrono::milliseconds(50));

    EXPECT_FALSE(client->sessionId());
    EXPECT_FALSE(client->sequence());
    EXPECT_EQ(socket().sentWithOpcode(OpCode::Identify).size(), 1u);

    drain(std::chrono::milliseconds(250));

    EXPECT_EQ(sockets.size(), 1u);
    EXPECT_EQ(socket().sentWithOpcode(OpCode::Identify).size(), 2u);
    EXPECT_TRUE(socket().sentWithOpcode(OpCode::Resume).empty());
}

TEST_F(GatewayClientTest, CloseDuringInvalidSessionDelayIdentifiesOnNewConnection) {
    backoffDelay = std::chrono::milliseconds(200);
    connectReady();

    socket().receive({{ "op", 9 }, { "d", false }});
    drain(std::chrono::milliseconds(50));

    socket().simulateClose(1006);
    drain(std::chrono::milliseconds(50));
    EXPECT_EQ(sockets.size(), 1u);

    drain(std::chrono::milliseconds(300));
    ASSERT_EQ(sockets.size(), 2u);
    EXPECT_EQ(sockets[0]->sentWithOpcode(OpCode::Identify).size(), 1u);

    socket().simulateOpen();
    drain();
    hello();

    EXPECT_EQ(socket().sentWithOpcode(OpCode::Identify).size(), 1u);
    EXPECT_TRUE(socket().sentWithOpcode(OpCode::Resume).empty());

    drain(std::chrono::milliseconds(250));
    EXPECT_EQ(sockets.size(), 2u);
    EXPECT_EQ(socket().sentWithOpcode(OpCode::Identify).size(), 1u);
}

TEST_F(GatewayClientTest, ReconnectRequestResumesOnNewConnection) {
    connectReady();

    socket().receive({{ "op", 7 }, { "d", nullptr }});
    drain();

    ASSERT_EQ(sockets.size(), 2u);
    EXPECT_EQ(sockets[0]->closeCode, 4000);
    EXPECT_EQ(*client->sessionId(), "session-1");

    socket().simulateOpen();
    drain();
    hello();
    EXPECT_EQ(socket().sentWithOpcode(OpCode::Resume).size(), 1u);
    EXPECT_TRUE(socket().sentWithOpcode(OpCode::Identify).empty());

    dispatch("RESUMED", 2, nullptr);
    EXPECT_TRUE(client->ready());
    EXPECT_EQ(client->state(), GatewayState::Connected);
}

TEST_F(GatewayClientTest, UnexpectedCloseReconnects) {
    connectReady();

    socket().simulateClose(1006);
    drain();

    ASSERT_EQ(sockets.size(), 2u);
    EXPECT_FALSE(client->ready());
    EXPECT_EQ(*client->sessionId(), "session-1");
    EXPECT_EQ(client->state(), GatewayState::Connecting);
}

TEST_F(GatewayClientTest, StaleCallbacksAreIgnored) {
    connectReady();
    std::shared_ptr<FakeSocket> first = sockets[0];
    GatewaySocket::Callbacks oldCallbacks = first->callbacks;

    first->simulateClose(1006);
    drain();
    ASSERT_EQ(sockets.size(), 2u);

    // Late message from replaced connection.
    std::string text = nlohmann::json({{ "op", 0 }, { "s", 50 }, { "t", "TYPING_START" }, { "d", nullptr }}).dump();
    GatewayFrame frame;
    frame.bytes.assign(text.begin(), text.end());
    oldCallbacks.onMessage(frame);
    oldCallbacks.onClose(1006, "");
    drain();

    EXPECT_EQ(*client->sequence(), 1);
    EXPECT_EQ(sockets.size(), 2u);
}

TEST_F(GatewayClientTest, SessionEndingCloseCodeClearsSession) {
    connectReady();

    socket().simulateClose(4009);
    drain();

    ASSERT_EQ(sockets.size(), 2u);
    EXPECT_FALSE(client->sessionId());
    EXPECT_EQ(socket().url, "wss://gateway.discord.gg/?v=10&encoding=json");

    socket().simulateOpen();
    drain();
    hello();
    EXPECT_EQ(socket().sentWithOpcode(OpCode::Identify).size(), 1u);
}

TEST_F(GatewayClientTest, FatalCloseCodeStopsReconnecting) {
    connectReady();

    socket().simulateClose(4004, "Authentication failed.");
    drain();

    EXPECT_EQ(sockets.size(), 1u);
    EXPECT_EQ(client->state(), GatewayState::Disconnected);
    EXPECT_FALSE(client->ready());

    auto error = client->fatalError();
    ASSERT_TRUE(error);
    EXPECT_EQ(error->code, 4004);
    EXPECT_STREQ(error->what(), "Authentication failed.");

    client->connect();
    drain();
    EXPECT_FALSE(client->fatalError());
    EXPECT_EQ(sockets.size(), 2u);
}

TEST_F(GatewayClientTest, DisconnectTwiceIsHarmless) {
    connectReady();

    client->disconnect();
    client->disconnect();
    drain();

    EXPECT_FALSE(client->ready());
    EXPECT_EQ(client->state(), GatewayState::Disconnected);
    EXPECT_EQ(sockets[0]->closeCode, 1000);
    EXPECT_EQ(sockets.size(), 1u);
}

TEST_F(GatewayClientTest, DisconnectCancelsPendingReconnect) {
    config.token = "TOKEN";
    client.reset(new GatewayClient(ios, config, dispatcher, cache,
        [this](boost::asio::io_service&) -> std::shared_ptr<GatewaySocket> {
            auto socket = std::make_shared<FakeSocket>();
            sockets.push_back(socket);
            return socket;
        }, std::make_shared<FixedBackoff>(std::chrono::milliseconds(200))));
    client->connect();
    openAndHello();
    ready();

    socket().simulateClose(1006);
    drain();
    EXPECT_EQ(client->state(), GatewayState::Reconnecting);

    client->disconnect();
    drain(std::chrono::milliseconds(300));

    EXPECT_EQ(sockets.size(), 1u);
    EXPECT_EQ(client->state(), GatewayState::Disconnected);
}

TEST_F(GatewayClientTest, ResumeSeedsSession) {
    makeClient();
    client->resume("old-session", 42);
    openAndHello();

    auto resumes = socket().sentWithOpcode(OpCode::Resume);
    ASSERT_EQ(resumes.size(), 1u);
    EXPECT_EQ(resumes[0]["d"]["session_id"], "old-session");
    EXPECT_EQ(resumes[0]["d"]["seq"], 42);
    EXPECT_EQ(resumes[0]["d"]["token"], "TOKEN");
}

TEST_F(GatewayClientTest, UpdatePresence) {
    connectReady();

    EXPECT_THROW(client->updatePresence("busy"), InvalidParameter);

    client->updatePresence("dnd", {{ "name", "tests" }, { "type", 0 }});
    drain();

    auto updates = socket().sentWithOpcode(OpCode::PresenceUpdate);
    ASSERT_EQ(updates.size(), 1u);
    EXPECT_EQ(updates[0]["d"]["status"], "dnd");
    EXPECT_TRUE(updates[0]["d"]["since"].is_null());
    EXPECT_EQ(updates[0]["d"]["afk"], false);
    ASSERT_EQ(updates[0]["d"]["activities"].size(), 1u);
    EXPECT_EQ(updates[0]["d"]["activities"][0]["name"], "tests");
}

TEST_F(GatewayClientTest, InitialPresenceIsSentInIdentify) {
    config.initialPresence = {{ "status", "idle" }, { "afk", false }};
    makeClient();
    client->connect();
    openAndHello();

    auto identifies = socket().sentWithOpcode(OpCode::Identify);
    ASSERT_EQ(identifies.size(), 1u);
    EXPECT_EQ(identifies[0]["d"]["presence"]["status"], "idle");
}
