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

#include <gatecord/payload_codec.hpp>
#include <iostream>
#include <gatecord/config.hpp>
#include <gatecord/exceptions.hpp>

#if defined(GATECORD_DEBUG_LOG)
    #define DEBUG_MSG(msg) do { std::cerr <<  "payload_codec.cpp:" << __LINE__ << " " << (msg) << '\n'; } while (false)
#else
    #define DEBUG_MSG(msg)
#endif

#define ERROR_MSG(msg) do { std::cerr <<  "payload_codec.cpp:" << __LINE__ << " " << (msg) << '\n'; } while (false)

namespace Gatecord {
namespace PayloadCodec {

std::string encode(const Envelope& envelope) {
    nlohmann::json message = {{ "op", envelope.opcode }};

    if (envelope.data)      message["d"] = *envelope.data;
    if (envelope.sequence)  message["s"] = *envelope.sequence;
    if (envelope.eventName) message["t"] = *envelope.eventName;

    return message.dump();
}

std::string encode(int opcode, const boost::optional<nlohmann::json>& data) {
    Envelope envelope;
    envelope.opcode = opcode;
    envelope.data   = data;
    return encode(envelope);
}

Envelope parse(const std::string& text) {
    nlohmann::json message = nlohmann::json::parse(text, nullptr, /* allow_exceptions: */ false);
    if (message.is_discarded()) {
        throw ProtocolError("Payload is not valid JSON.");
    }
    if (!message.is_object()) {
        throw ProtocolError("Payload is not JSON object.");
    }

    auto opIt = message.find("op");
    if (opIt == message.end() || !opIt->is_number_integer()) {
        throw ProtocolError("Payload doesn't contain integer op-code.");
    }

    Envelope envelope;
    envelope.opcode = opIt->get<int>();

    auto dataIt = message.find("d");
    if (dataIt != message.end()) {
        envelope.data = std::move(*dataIt);
    }

    // Server sends "s": null and "t": null for non-dispatch payloads.
    auto sequenceIt = message.find("s");
    if (sequenceIt != message.end() && !sequenceIt->is_null()) {
        if (!sequenceIt->is_number_integer()) throw ProtocolError("Sequence number is not integer.");
        envelope.sequence = sequenceIt->get<int64_t>();
    }

    auto eventIt = message.find("t");
    if (eventIt != message.end() && !eventIt->is_null()) {
        if (!eventIt->is_string()) throw ProtocolError("Event name is not string.");
        envelope.eventName = eventIt->get<std::string>();
    }

    return envelope;
}

} // namespace PayloadCodec

boost::optional<Envelope> PayloadDecoder::decode(const GatewayFrame& frame) {
    try {
        if (!frame.binary) {
            return PayloadCodec::parse(std::string(frame.bytes.begin(), frame.bytes.end()));
        }

        std::vector<uint8_t> inflated = inflateStream.feed(frame.bytes);
        pendingText.insert(pendingText.end(), inflated.begin(), inflated.end());

        if (!Zlib::endsWithSyncFlush(frame.bytes) && !inflateStream.streamEnded()) {
            // Message is split between frames, wait for rest.
            DEBUG_MSG("Partial compressed message, waiting for next frame.");
            return boost::none;
        }

        std::string text;
        text.swap(pendingText);
        return PayloadCodec::parse(text);
    } catch (ZlibError& excp) {
        pendingText.clear();
        ERROR_MSG(std::string("Dropping compressed frame: ") + excp.what());
    } catch (ProtocolError& excp) {
        ERROR_MSG(std::string("Dropping malformed frame: ") + excp.what());
    }
    return boost::none;
}

} // namespace Gatecord
