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

#include <gatecord/gateway_client.hpp>
#include <iostream>
#include <boost/asio/error.hpp>                             // boost::asio::error::operation_aborted
#include <boost/date_time/posix_time/posix_time_types.hpp>  // boost::posix_time::milliseconds
#include <gatecord/config.hpp>
#include <gatecord/exceptions.hpp>
#include <gatecord/internal/utils.hpp>                      // Utils::osName, Utils::stringToLower

#if defined(GATECORD_DEBUG_LOG)
    #define DEBUG_MSG(msg) do { std::cerr <<  "gateway_client.cpp:" << __LINE__ << " " << (msg) << '\n'; } while (false)
#else
    #define DEBUG_MSG(msg)
#endif

#define ERROR_MSG(msg) do { std::cerr <<  "gateway_client.cpp:" << __LINE__ << " " << (msg) << '\n'; } while (false)

namespace Gatecord {

namespace {
    // Close code that doesn't invalidate session on server side.
    constexpr int ReconnectCloseCode = 4000;
    constexpr int NormalCloseCode    = 1000;
}

const char* gatewayStateName(GatewayState state) {
    switch (state) {
    case GatewayState::Disconnected:  return "Disconnected";
    case GatewayState::Connecting:    return "Connecting";
    case GatewayState::AwaitingHello: return "AwaitingHello";
    case GatewayState::Identifying:   return "Identifying";
    case GatewayState::Resuming:      return "Resuming";
    case GatewayState::Connected:     return "Connected";
    case GatewayState::Reconnecting:  return "Reconnecting";
    }
    return "Unknown";
}

bool GatewayClient::isFatalCloseCode(int code) {
    return code == 4004 ||                 // authentication failed
           (code >= 4010 && code <= 4014); // invalid shard, sharding required, invalid API version,
                                           // invalid intents, disallowed intents
}

bool GatewayClient::isSessionEndingCloseCode(int code) {
    return code == 4007 || // invalid seq
           code == 4009;   // session timed out
}

GatewayClient::GatewayClient(boost::asio::io_service& ioService,
                             const GatewayConfig& config,
                             EventDispatcher& dispatcher,
                             StateCache& cache,
                             SocketFactory socketFactory,
                             std::shared_ptr<BackoffPolicy> backoff)
    : config_(config)
    , dispatcher(dispatcher)
    , cache(cache)
    , socketFactory(std::move(socketFactory))
    , backoff(std::move(backoff))
    , ioService(ioService)
    , strand(ioService)
    , heartbeat(strand)
    , reconnectTimer(ioService)
    , sessionTimer(ioService) {

    if (config_.token.empty()) {
        throw InvalidParameter("token", "token should not be empty.");
    }
    if (!this->socketFactory) {
        throw InvalidParameter("socketFactory", "socket factory should not be empty.");
    }
    if (!this->backoff) {
        throw InvalidParameter("backoff", "backoff policy should not be null.");
    }
}

GatewayClient::~GatewayClient() {
    stopRequested = true;
    teardown();
}

void GatewayClient::connect() {
    stopRequested = false;
    {
        std::lock_guard<std::mutex> lock(stateMutex);
        fatalError_ = boost::none;
    }
    strand.dispatch([this]() {
        if (connection || state() != GatewayState::Disconnected) {
            DEBUG_MSG("connect() called while connection is active, ignoring.");
            return;
        }
        openConnection();
    });
}

void GatewayClient::resume(const std::string& sessionId, int64_t sequence) {
    DEBUG_MSG(std::string("Resuming session ") + sessionId + " from seq=" + std::to_string(sequence));
    {
        std::lock_guard<std::mutex> lock(stateMutex);
        session.sessionId = sessionId;
        session.sequence  = sequence;
    }
    connect();
}

void GatewayClient::disconnect() noexcept {
    DEBUG_MSG("Disconnect requested.");
    stopRequested = true;
    try {
        strand.dispatch([this]() { teardown(); });
    } catch (std::exception& excp) {
        ERROR_MSG(std::string("Failed to schedule disconnect: ") + excp.what());
    }
}

void GatewayClient::updatePresence(const std::string& status, const nlohmann::json& activity) {
    if (status != "online" && status != "dnd" && status != "idle" && status != "invisible") {
        throw InvalidParameter("status", "status should be one of: online, dnd, idle, invisible.");
    }

    nlohmann::json activities = nlohmann::json::array();
    if (!activity.is_null()) activities.push_back(activity);

    nlohmann::json data = {
        { "since",      nullptr    },
        { "activities", activities },
        { "status",     status     },
        { "afk",        false      }
    };

    strand.dispatch([this, data]() {
        if (!connection || !connection->socket->isOpen()) {
            ERROR_MSG("Not connected to gateway, presence update skipped.");
            return;
        }
        send(OpCode::PresenceUpdate, data);
    });
}

boost::optional<GatewayError> GatewayClient::fatalError() const {
    std::lock_guard<std::mutex> lock(stateMutex);
    return fatalError_;
}

GatewayState GatewayClient::state() const {
    std::lock_guard<std::mutex> lock(stateMutex);
    return state_;
}

bool GatewayClient::ready() const {
    std::lock_guard<std::mutex> lock(stateMutex);
    return session.ready;
}

boost::optional<std::string> GatewayClient::sessionId() const {
    std::lock_guard<std::mutex> lock(stateMutex);
    return session.sessionId;
}

boost::optional<int64_t> GatewayClient::sequence() const {
    std::lock_guard<std::mutex> lock(stateMutex);
    return session.sequence;
}

unsigned GatewayClient::heartbeatIntervalMs() const {
    std::lock_guard<std::mutex> lock(stateMutex);
    return heartbeatIntervalMs_;
}

std::string GatewayClient::connectionUrl() const {
    std::string baseUrl;
    {
        std::lock_guard<std::mutex> lock(stateMutex);
        bool resumable = session.sessionId && session.sequence && session.resumeGatewayUrl;
        baseUrl = resumable ? *session.resumeGatewayUrl : config_.gatewayUrl;
    }
    return buildUrl(baseUrl);
}

std::string GatewayClient::buildUrl(const std::string& baseUrl) const {
    std::string url = baseUrl;
    while (!url.empty() && url.back() == '/') url.pop_back();

    url += "/?v=" + std::to_string(config_.apiVersion) + "&encoding=json";
    if (config_.transportCompression) url += "&compress=zlib-stream";
    return url;
}

void GatewayClient::setState(GatewayState newState) {
    std::lock_guard<std::mutex> lock(stateMutex);
    DEBUG_MSG(std::string("State: ") + gatewayStateName(state_) + " -> " + gatewayStateName(newState));
    state_ = newState;
}

void GatewayClient::clearSession() {
    DEBUG_MSG("Session invalidated.");
    std::lock_guard<std::mutex> lock(stateMutex);
    session.sessionId        = boost::none;
    session.sequence         = boost::none;
    session.resumeGatewayUrl = boost::none;
    session.ready            = false;
}

void GatewayClient::openConnection() {
    std::string url = connectionUrl();
    uint64_t id = ++lastConnectionId;

    DEBUG_MSG(std::string("Opening connection #") + std::to_string(id) + " to " + url);

    connection.reset(new Connection);
    connection->id     = id;
    connection->socket = socketFactory(ioService);
    setState(GatewayState::Connecting);

    GatewaySocket::Callbacks callbacks;
    callbacks.onOpen = strand.wrap([this, id]() {
        onSocketOpen(id);
    });
    callbacks.onMessage = strand.wrap([this, id](const GatewayFrame& frame) {
        onSocketMessage(id, frame);
    });
    callbacks.onClose = strand.wrap([this, id](int code, const std::string& reason) {
        onSocketClose(id, code, reason);
    });
    callbacks.onError = strand.wrap([this, id](const boost::system::error_code& ec) {
        onSocketError(id, ec);
    });

    connection->socket->open(url, callbacks);
}

void GatewayClient::teardown() noexcept {
    heartbeat.stop();

    boost::system::error_code ignored;
    reconnectTimer.cancel(ignored);
    sessionTimer.cancel(ignored);

    if (connection) {
        DEBUG_MSG(std::string("Closing connection #") + std::to_string(connection->id));
        connection->socket->close(NormalCloseCode);
        connection.reset();
    }

    std::lock_guard<std::mutex> lock(stateMutex);
    session.ready = false;
    state_        = GatewayState::Disconnected;
}

void GatewayClient::dropConnection(int closeCode) {
    heartbeat.stop();

    if (connection) {
        DEBUG_MSG(std::string("Dropping connection #") + std::to_string(connection->id) +
                  " with code " + std::to_string(closeCode));
        std::unique_ptr<Connection> dropped = std::move(connection);
        dropped->socket->close(closeCode);
    }

    std::lock_guard<std::mutex> lock(stateMutex);
    session.ready = false;
}

void GatewayClient::scheduleReconnect() {
    if (stopRequested) return;

    setState(GatewayState::Reconnecting);

    std::chrono::milliseconds delay = backoff->nextDelay();
    DEBUG_MSG(std::string("Reconnecting in ") + std::to_string(delay.count()) + " ms.");

    reconnectTimer.expires_from_now(boost::posix_time::milliseconds(delay.count()));
    reconnectTimer.async_wait(strand.wrap([this](const boost::system::error_code& ec) {
        if (ec == boost::asio::error::operation_aborted) return;
        if (stopRequested || state() != GatewayState::Reconnecting) return;

        openConnection();
    }));
}

void GatewayClient::onSocketOpen(uint64_t connectionId) {
    if (!connection || connection->id != connectionId) return;

    DEBUG_MSG("Connection open, waiting for Hello.");
    setState(GatewayState::AwaitingHello);
}

void GatewayClient::onSocketMessage(uint64_t connectionId, const GatewayFrame& frame) {
    if (!connection || connection->id != connectionId) return;

    boost::optional<Envelope> envelope = connection->decoder.decode(frame);
    if (!envelope) return;

    try {
        processEnvelope(*envelope);
    } catch (std::exception& excp) {
        ERROR_MSG(std::string("Dropping gateway payload (op=") + std::to_string(envelope->opcode) + "): " + excp.what());
    }
}

void GatewayClient::onSocketClose(uint64_t connectionId, int code, const std::string& reason) {
    if (!connection || connection->id != connectionId) return;

    DEBUG_MSG(std::string("Connection #") + std::to_string(connectionId) + " closed, code=" +
              std::to_string(code) + " reason=" + reason);

    heartbeat.stop();
    connection.reset();
    {
        std::lock_guard<std::mutex> lock(stateMutex);
        session.ready = false;
    }
    setState(GatewayState::Disconnected);

    if (stopRequested) return;

    if (isFatalCloseCode(code)) {
        ERROR_MSG(std::string("Gateway closed connection with unrecoverable code ") +
                  std::to_string(code) + " (" + reason + "), not reconnecting.");
        stopRequested = true;
        {
            std::lock_guard<std::mutex> lock(stateMutex);
            fatalError_.emplace(reason.empty() ? std::string("Gateway closed connection.") : reason, code);
        }
        return;
    }
    if (isSessionEndingCloseCode(code)) {
        clearSession();
    }

    scheduleReconnect();
}

void GatewayClient::onSocketError(uint64_t connectionId, const boost::system::error_code& ec) {
    if (!connection || connection->id != connectionId) return;

    ERROR_MSG(std::string("Gateway transport error: ") + ec.message());
}

void GatewayClient::processEnvelope(const Envelope& envelope) {
    if (envelope.sequence) {
        std::lock_guard<std::mutex> lock(stateMutex);
        if (!session.sequence || *session.sequence < *envelope.sequence) {
            session.sequence = envelope.sequence;
        }
    }

    switch (envelope.opcode) {
    case OpCode::Hello:
        processHello(envelope);
        break;
    case OpCode::HeartbeatAck:
        heartbeat.acknowledge();
        break;
    case OpCode::Heartbeat:
        DEBUG_MSG("Server requested heartbeat.");
        sendHeartbeat();
        break;
    case OpCode::Dispatch:
        processDispatch(envelope);
        break;
    case OpCode::Reconnect:
        DEBUG_MSG("Server asked us to reconnect.");
        dropConnection(ReconnectCloseCode);
        scheduleReconnect();
        break;
    case OpCode::InvalidSession:
        processInvalidSession(envelope);
        break;
    default:
        DEBUG_MSG(std::string("Unexpected op-code: ") + std::to_string(envelope.opcode));
    }
}

void GatewayClient::processHello(const Envelope& envelope) {
    if (!envelope.data || !envelope.data->is_object()) {
        throw ProtocolError("Hello payload without data.");
    }

    unsigned interval = envelope.data->at("heartbeat_interval").get<unsigned>();
    if (interval == 0) {
        throw ProtocolError("Hello payload with zero heartbeat interval.");
    }

    DEBUG_MSG(std::string("Hello, heartbeat interval: ") + std::to_string(interval) + " ms.");
    connection->heartbeatIntervalMs = interval;
    {
        std::lock_guard<std::mutex> lock(stateMutex);
        heartbeatIntervalMs_ = interval;
    }

    uint64_t connectionId = connection->id;
    heartbeat.start(interval, [this]() {
        sendHeartbeat();
    }, [this, connectionId]() {
        if (!connection || connection->id != connectionId) return;

        ERROR_MSG("Heartbeat was not acknowledged, reconnecting.");
        dropConnection(ReconnectCloseCode);
        scheduleReconnect();
    });

    bool canResume;
    {
        std::lock_guard<std::mutex> lock(stateMutex);
        canResume = session.sessionId && session.sequence;
    }

    if (canResume) {
        sendResume();
    } else {
        sendIdentify();
    }
}

void GatewayClient::processDispatch(const Envelope& envelope) {
    if (!envelope.eventName) {
        throw ProtocolError("Dispatch payload without event name.");
    }

    const std::string& name = *envelope.eventName;
    nlohmann::json data = envelope.data ? *envelope.data : nlohmann::json();

    DEBUG_MSG(std::string("Event: ") + name);

    if (name == "READY") {
        std::string sessionId = data.at("session_id").get<std::string>();
        cache.handleReady(data);
        {
            std::lock_guard<std::mutex> lock(stateMutex);
            session.sessionId = sessionId;
            auto urlIt = data.find("resume_gateway_url");
            if (urlIt != data.end() && urlIt->is_string()) {
                session.resumeGatewayUrl = urlIt->get<std::string>();
            }
            session.ready = true;
        }
        setState(GatewayState::Connected);
    } else if (name == "RESUMED") {
        {
            std::lock_guard<std::mutex> lock(stateMutex);
            session.ready = true;
        }
        setState(GatewayState::Connected);
    } else if (name == "GUILD_CREATE") {
        cache.upsertGuild(data);
    } else if (name == "CHANNEL_CREATE" || name == "CHANNEL_UPDATE") {
        cache.upsertChannel(data);
    } else if (name == "CHANNEL_DELETE") {
        cache.removeChannel(data);
    }

    dispatcher.dispatchEvent(Utils::stringToLower(name), data);
}

void GatewayClient::processInvalidSession(const Envelope& envelope) {
    bool resumable = envelope.data && envelope.data->is_boolean() && envelope.data->get<bool>();

    if (resumable) {
        DEBUG_MSG("Invalid session (resumable), resuming.");
        bool canResume;
        {
            std::lock_guard<std::mutex> lock(stateMutex);
            canResume = session.sessionId && session.sequence;
        }
        if (canResume) {
            sendResume();
        } else {
            sendIdentify();
        }
        return;
    }

    DEBUG_MSG("Invalid session (not resumable), identifying after delay.");
    clearSession();

    uint64_t connectionId = connection->id;
    std::chrono::milliseconds delay = backoff->nextDelay();

    sessionTimer.expires_from_now(boost::posix_time::milliseconds(delay.count()));
    sessionTimer.async_wait(strand.wrap([this, connectionId](const boost::system::error_code& ec) {
        if (ec == boost::asio::error::operation_aborted) return;
        if (stopRequested) return;

        if (connection && connection->id == connectionId && connection->socket->isOpen()) {
            sendIdentify();
        } else if (!connection && state() == GatewayState::Disconnected) {
            openConnection();
        }
    }));
}

void GatewayClient::sendIdentify() {
    setState(GatewayState::Identifying);

    nlohmann::json identify = {
        { "token",   config_.token           },
        { "intents", config_.intents.value() },
        { "properties", {
            { "os",      Utils::osName()    },
            { "browser", config_.clientName },
            { "device",  config_.clientName }
        }},
        // Per-payload compression makes no sense together with zlib-stream.
        { "compress",        config_.payloadCompression && !config_.transportCompression },
        { "large_threshold", config_.largeThreshold }
    };

    if (config_.shardId != GatewayConfig::NoSharding && config_.shardCount != GatewayConfig::NoSharding) {
        nlohmann::json shard = nlohmann::json::array();
        shard.push_back(config_.shardId);
        shard.push_back(config_.shardCount);
        identify["shard"] = shard;
    }

    if (!config_.initialPresence.is_null()) {
        identify["presence"] = config_.initialPresence;
    }

    DEBUG_MSG("Sending Identify.");
    send(OpCode::Identify, identify);
}

void GatewayClient::sendResume() {
    setState(GatewayState::Resuming);

    nlohmann::json resume;
    {
        std::lock_guard<std::mutex> lock(stateMutex);
        resume = {
            { "token",      config_.token      },
            { "session_id", *session.sessionId },
            { "seq",        *session.sequence  }
        };
    }

    DEBUG_MSG("Sending Resume.");
    send(OpCode::Resume, resume);
}

void GatewayClient::sendHeartbeat() {
    nlohmann::json sequence;
    {
        std::lock_guard<std::mutex> lock(stateMutex);
        if (session.sequence) sequence = *session.sequence;
    }

    DEBUG_MSG(std::string("Sending heartbeat, seq=") + sequence.dump());
    send(OpCode::Heartbeat, sequence);
}

void GatewayClient::send(int opcode, const nlohmann::json& data) {
    if (!connection) {
        DEBUG_MSG(std::string("No connection, dropping outgoing op=") + std::to_string(opcode));
        return;
    }
    connection->socket->send(PayloadCodec::encode(opcode, data));
}

} // namespace Gatecord
