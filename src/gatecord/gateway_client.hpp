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

#ifndef GATECORD_GATEWAY_CLIENT_HPP
#define GATECORD_GATEWAY_CLIENT_HPP

#include <cstdint>                              // int64_t, uint64_t
#include <string>                               // std::string
#include <memory>                               // std::shared_ptr, std::unique_ptr
#include <mutex>                                // std::mutex
#include <atomic>                               // std::atomic
#include <boost/optional.hpp>                   // boost::optional
#include <boost/asio/io_service.hpp>            // boost::asio::io_service
#include <boost/asio/io_context_strand.hpp>     // boost::asio::io_service::strand
#include <boost/asio/deadline_timer.hpp>        // boost::asio::deadline_timer
#include <nlohmann/json.hpp>                    // nlohmann::json
#include <gatecord/exceptions.hpp>              // GatewayError
#include <gatecord/intents.hpp>                 // Intents
#include <gatecord/gateway_socket.hpp>          // GatewaySocket, SocketFactory
#include <gatecord/payload_codec.hpp>           // Envelope, PayloadDecoder
#include <gatecord/heartbeat_scheduler.hpp>     // HeartbeatScheduler
#include <gatecord/backoff.hpp>                 // BackoffPolicy, JitteredBackoff
#include <gatecord/event_dispatcher.hpp>        // EventDispatcher
#include <gatecord/state_cache.hpp>             // StateCache

namespace Gatecord {
    enum class GatewayState {
        Disconnected,
        Connecting,
        AwaitingHello,
        Identifying,
        Resuming,
        Connected,
        Reconnecting
    };

    const char* gatewayStateName(GatewayState state);

    struct GatewayConfig {
        static constexpr int NoSharding = -1;

        std::string token;
        Intents intents;

        /// Base gateway URL, query string is appended by client.
        std::string gatewayUrl = "wss://gateway.discord.gg";
        int apiVersion = 10;

        /// Request zlib-stream transport compression (all frames are binary).
        bool transportCompression = false;
        /// Value of "compress" field in Identify payload.
        bool payloadCompression = true;

        unsigned largeThreshold = 250;

        /// Sent as browser and device properties in Identify payload.
        std::string clientName = "gatecord";

        int shardId = NoSharding, shardCount = NoSharding;

        /// Sent as "presence" in Identify payload if not null.
        nlohmann::json initialPresence;
    };

    /**
     *  Discord gateway connection lifecycle:
     *  connect → identify/resume → heartbeat → dispatch → reconnect.
     *
     *  All work is done asynchronously on ioService passed to constructor,
     *  so ioService should be running for client to make progress. Connection
     *  losses are recovered transparently (by resuming session when possible,
     *  otherwise by identifying again).
     *
     *  Received events are forwarded to dispatcher passed to constructor
     *  using lower-cased event name (see \ref Event namespace), some events
     *  also update cache.
     */
    class GatewayClient {
    public:
        /**
         *  Close codes after which reconnecting makes no sense
         *  (authentication failed, invalid shard, disallowed intents, etc).
         */
        static bool isFatalCloseCode(int code);

        /**
         *  Close codes after which session can't be resumed.
         */
        static bool isSessionEndingCloseCode(int code);

        /**
         *  dispatcher and cache are not owned and should outlive client.
         *
         *  \throws InvalidParameter if config.token is empty.
         */
        GatewayClient(boost::asio::io_service& ioService,
                      const GatewayConfig& config,
                      EventDispatcher& dispatcher,
                      StateCache& cache,
                      SocketFactory socketFactory = makeTLSWebSocket,
                      std::shared_ptr<BackoffPolicy> backoff = std::make_shared<JitteredBackoff>());
        ~GatewayClient();

        GatewayClient(const GatewayClient&) = delete;
        GatewayClient& operator=(const GatewayClient&) = delete;

        /**
         *  Start connecting, returns immediately. Does nothing if client is
         *  already connected or connecting.
         */
        void connect();

        /**
         *  Continue session from previous process: next Hello is answered
         *  with Resume using passed session ID and sequence number instead
         *  of Identify.
         *
         *  If server rejects resume, new session is started.
         */
        void resume(const std::string& sessionId, int64_t sequence);

        /**
         *  Close connection and stop reconnecting. Idempotent.
         *  connect() can be called again later.
         */
        void disconnect() noexcept;

        /**
         *  Send Presence Update. status is one of "online", "dnd", "idle",
         *  "invisible"; activity is null or activity object.
         *
         *  \throws InvalidParameter if status is unknown.
         */
        void updatePresence(const std::string& status = "online",
                            const nlohmann::json& activity = nullptr);

        GatewayState state() const;
        bool ready() const;
        boost::optional<std::string> sessionId() const;
        boost::optional<int64_t> sequence() const;

        /**
         *  Set when gateway closed connection with unrecoverable close code
         *  (\ref isFatalCloseCode), GatewayError::code is the close code.
         *  Cleared by \ref connect.
         */
        boost::optional<GatewayError> fatalError() const;

        /**
         *  Interval received in last Hello, 0 if none received yet.
         */
        unsigned heartbeatIntervalMs() const;

        /**
         *  URL used for next connection attempt.
         */
        std::string connectionUrl() const;

        inline const GatewayConfig& config() const {
            return config_;
        }
    private:
        struct SessionState {
            boost::optional<std::string> sessionId;
            boost::optional<int64_t>     sequence;
            bool                         ready = false;
            boost::optional<std::string> resumeGatewayUrl;
        };

        struct Connection {
            uint64_t id;
            std::shared_ptr<GatewaySocket> socket;
            PayloadDecoder decoder;
            unsigned heartbeatIntervalMs = 0;
        };

        // All methods below are executed on strand.
        void openConnection();
        void teardown() noexcept;
        void dropConnection(int closeCode);
        void scheduleReconnect();

        void onSocketOpen(uint64_t connectionId);
        void onSocketMessage(uint64_t connectionId, const GatewayFrame& frame);
        void onSocketClose(uint64_t connectionId, int code, const std::string& reason);
        void onSocketError(uint64_t connectionId, const boost::system::error_code& ec);

        void processEnvelope(const Envelope& envelope);
        void processHello(const Envelope& envelope);
        void processDispatch(const Envelope& envelope);
        void processInvalidSession(const Envelope& envelope);

        void sendIdentify();
        void sendResume();
        void sendHeartbeat();
        void send(int opcode, const nlohmann::json& data);

        void setState(GatewayState newState);
        void clearSession();
        std::string buildUrl(const std::string& baseUrl) const;

        const GatewayConfig config_;
        EventDispatcher& dispatcher;
        StateCache& cache;
        SocketFactory socketFactory;
        std::shared_ptr<BackoffPolicy> backoff;

        boost::asio::io_service& ioService; // non-owning reference to I/O service.
        boost::asio::io_service::strand strand;
        HeartbeatScheduler heartbeat;
        boost::asio::deadline_timer reconnectTimer;
        boost::asio::deadline_timer sessionTimer;

        std::unique_ptr<Connection> connection;
        uint64_t lastConnectionId = 0;

        std::atomic<bool> stopRequested{false};

        mutable std::mutex stateMutex;
        SessionState session;
        GatewayState state_ = GatewayState::Disconnected;
        boost::optional<GatewayError> fatalError_;
        unsigned heartbeatIntervalMs_ = 0;
    };
} // namespace Gatecord

#endif // GATECORD_GATEWAY_CLIENT_HPP
