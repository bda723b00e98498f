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

#ifndef GATECORD_PAYLOAD_CODEC_HPP
#define GATECORD_PAYLOAD_CODEC_HPP

#include <cstdint>                      // int64_t
#include <string>                       // std::string
#include <boost/optional.hpp>           // boost::optional
#include <nlohmann/json.hpp>            // nlohmann::json
#include <gatecord/gateway_socket.hpp>  // GatewayFrame
#include <gatecord/internal/zlib.hpp>   // Zlib::InflateStream

/**
 *  \file payload_codec.hpp
 *
 *  Gateway payloads (envelopes) encoding and decoding.
 */

namespace Gatecord {
    /**
     *  Op-codes valid for gateway API.
     */
    namespace OpCode {
        /// Event dispatch (sent by server).
        constexpr int Dispatch = 0;
        /// Ping checking (sent by client, server may request it).
        constexpr int Heartbeat = 1;
        /// Client handshake (sent by client).
        constexpr int Identify = 2;
        /// Client presence update (sent by client).
        constexpr int PresenceUpdate = 3;
        /// Join/move/leave voice channels (sent by client).
        constexpr int VoiceStateUpdate = 4;
        /// Resume closed connection (sent by client).
        constexpr int Resume = 6;
        /// Request client to reconnect (sent by server).
        constexpr int Reconnect = 7;
        /// Request guild members (sent by client).
        constexpr int RequestGuildMembers = 8;
        /// Notify client they have an invalid session id.
        constexpr int InvalidSession = 9;
        /// Sent immediately after connecting (sent by server).
        constexpr int Hello = 10;
        /// Sent immediately following a client heartbeat that was received (sent by server).
        constexpr int HeartbeatAck = 11;
    }

    /**
     *  Gateway message: { "op": ..., "d": ..., "s": ..., "t": ... }.
     *
     *  Absent fields are none, `"d": null` is present null value.
     */
    struct Envelope {
        int opcode = 0;
        boost::optional<nlohmann::json> data;
        boost::optional<int64_t> sequence;
        boost::optional<std::string> eventName;
    };

    namespace PayloadCodec {
        /**
         *  Serialize envelope to compact JSON. Absent fields are omitted.
         */
        std::string encode(const Envelope& envelope);

        std::string encode(int opcode, const boost::optional<nlohmann::json>& data = boost::none);

        /**
         *  Parse JSON text into Envelope.
         *
         *  \throws ProtocolError if text is not a JSON object with integer "op"
         *          or "s"/"t" have wrong types.
         */
        Envelope parse(const std::string& text);
    }

    /**
     *  Decoder bound to single gateway connection. Holds zlib stream used
     *  for binary frames so it should not outlive the connection.
     */
    class PayloadDecoder {
    public:
        PayloadDecoder() = default;

        PayloadDecoder(const PayloadDecoder&) = delete;
        PayloadDecoder& operator=(const PayloadDecoder&) = delete;

        /**
         *  Decode frame. Malformed frames are logged and dropped (none returned).
         *
         *  Compressed message may be split between several binary frames,
         *  none is returned until its last frame is received.
         */
        boost::optional<Envelope> decode(const GatewayFrame& frame);
    private:
        Zlib::InflateStream inflateStream;

        // Inflated text of compressed message received only partially.
        std::string pendingText;
    };
} // namespace Gatecord

#endif // GATECORD_PAYLOAD_CODEC_HPP
