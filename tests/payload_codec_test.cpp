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

#include <gtest/gtest.h>
#include <zlib.h>
#include <gatecord/payload_codec.hpp>
#include <gatecord/exceptions.hpp>

using namespace Gatecord;

namespace {
    GatewayFrame textFrame(const std::string& text) {
        GatewayFrame frame;
        frame.bytes.assign(text.begin(), text.end());
        return frame;
    }

    std::vector<uint8_t> compressWhole(const std::string& text) {
        uLongf size = compressBound(text.size());
        std::vector<uint8_t> result(size);
        int status = compress(result.data(), &size, reinterpret_cast<const Bytef*>(text.data()), text.size());
        EXPECT_EQ(status, Z_OK);
        result.resize(size);
        return result;
    }

    // Same as zlib-stream transport: one deflate stream, messages end with Z_SYNC_FLUSH.
    std::vector<uint8_t> compressSyncFlush(z_stream& stream, const std::string& text) {
        std::vector<uint8_t> output(deflateBound(&stream, text.size()) + 16);

        stream.next_in   = reinterpret_cast<Bytef*>(const_cast<char*>(text.data()));
        stream.avail_in  = static_cast<uInt>(text.size());
        stream.next_out  = output.data();
        stream.avail_out = static_cast<uInt>(output.size());

        EXPECT_EQ(deflate(&stream, Z_SYNC_FLUSH), Z_OK);
        output.resize(output.size() - stream.avail_out);
        return output;
    }

    GatewayFrame binaryFrame(std::vector<uint8_t>::const_iterator begin, std::vector<uint8_t>::const_iterator end) {
        GatewayFrame frame;
        frame.binary = true;
        frame.bytes.assign(begin, end);
        return frame;
    }
}

TEST(PayloadCodec, EncodeOmitsAbsentFields) {
    std::string text = PayloadCodec::encode(OpCode::HeartbeatAck);
    nlohmann::json parsed = nlohmann::json::parse(text);

    EXPECT_EQ(parsed, nlohmann::json({{ "op", 11 }}));

    Envelope envelope = PayloadCodec::parse(text);
    EXPECT_EQ(envelope.opcode, OpCode::HeartbeatAck);
    EXPECT_FALSE(envelope.data);
    EXPECT_FALSE(envelope.sequence);
    EXPECT_FALSE(envelope.eventName);
}

TEST(PayloadCodec, EncodeAllFields) {
    Envelope envelope;
    envelope.opcode    = OpCode::Dispatch;
    envelope.data      = nlohmann::json({{ "a", 1 }});
    envelope.sequence  = 12;
    envelope.eventName = std::string("MESSAGE_CREATE");

    nlohmann::json parsed = nlohmann::json::parse(PayloadCodec::encode(envelope));
    EXPECT_EQ(parsed["op"], 0);
    EXPECT_EQ(parsed["d"]["a"], 1);
    EXPECT_EQ(parsed["s"], 12);
    EXPECT_EQ(parsed["t"], "MESSAGE_CREATE");
}

TEST(PayloadCodec, NullDataIsPresent) {
    Envelope heartbeat = PayloadCodec::parse(R"({"op":1,"d":null})");
    ASSERT_TRUE(heartbeat.data);
    EXPECT_TRUE(heartbeat.data->is_null());

    EXPECT_EQ(PayloadCodec::encode(OpCode::Heartbeat, nlohmann::json()), R"({"d":null,"op":1})");
}

TEST(PayloadCodec, NullSequenceAndNameAreAbsent) {
    Envelope envelope = PayloadCodec::parse(R"({"op":11,"d":null,"s":null,"t":null})");
    EXPECT_FALSE(envelope.sequence);
    EXPECT_FALSE(envelope.eventName);
}

TEST(PayloadCodec, RejectsMalformedPayloads) {
    EXPECT_THROW(PayloadCodec::parse("{"), ProtocolError);
    EXPECT_THROW(PayloadCodec::parse("[1, 2]"), ProtocolError);
    EXPECT_THROW(PayloadCodec::parse(R"({"d": 1})"), ProtocolError);
    EXPECT_THROW(PayloadCodec::parse(R"({"op": "10"})"), ProtocolError);
    EXPECT_THROW(PayloadCodec::parse(R"({"op": 0, "s": "7"})"), ProtocolError);
    EXPECT_THROW(PayloadCodec::parse(R"({"op": 0, "t": 5})"), ProtocolError);
}

TEST(PayloadDecoder, DecodesTextFrames) {
    PayloadDecoder decoder;
    auto envelope = decoder.decode(textFrame(R"({"op":10,"d":{"heartbeat_interval":41250}})"));

    ASSERT_TRUE(envelope);
    EXPECT_EQ(envelope->opcode, OpCode::Hello);
    EXPECT_EQ((*envelope->data)["heartbeat_interval"], 41250);
}

TEST(PayloadDecoder, DropsMalformedFrames) {
    PayloadDecoder decoder;
    EXPECT_FALSE(decoder.decode(textFrame("not json")));

    GatewayFrame garbage;
    garbage.binary = true;
    garbage.bytes  = { 0x01, 0x02, 0x03, 0x04 };
    EXPECT_FALSE(decoder.decode(garbage));

    // Decoder is still usable after failure.
    EXPECT_TRUE(decoder.decode(textFrame(R"({"op":11})")));
}

TEST(PayloadDecoder, DecodesCompressedFrames) {
    PayloadDecoder decoder;

    GatewayFrame frame;
    frame.binary = true;
    frame.bytes  = compressWhole(R"({"op":0,"s":3,"t":"READY","d":{"session_id":"abc"}})");

    auto envelope = decoder.decode(frame);
    ASSERT_TRUE(envelope);
    EXPECT_EQ(*envelope->eventName, "READY");
    EXPECT_EQ(*envelope->sequence, 3);
    EXPECT_EQ((*envelope->data)["session_id"], "abc");
}

TEST(PayloadDecoder, JoinsStreamMessageSplitBetweenFrames) {
    z_stream stream{};
    ASSERT_EQ(deflateInit(&stream, Z_DEFAULT_COMPRESSION), Z_OK);

    std::vector<uint8_t> first  = compressSyncFlush(stream, R"({"op":11})");
    std::vector<uint8_t> second = compressSyncFlush(stream,
        R"({"op":0,"s":7,"t":"MESSAGE_CREATE","d":{"content":"split between two frames"}})");
    deflateEnd(&stream);

    PayloadDecoder decoder;
    auto ack = decoder.decode(binaryFrame(first.begin(), first.end()));
    ASSERT_TRUE(ack);
    EXPECT_EQ(ack->opcode, OpCode::HeartbeatAck);

    auto middle = second.begin() + second.size() / 2;
    EXPECT_FALSE(decoder.decode(binaryFrame(second.begin(), middle)));

    auto envelope = decoder.decode(binaryFrame(middle, second.end()));
    ASSERT_TRUE(envelope);
    EXPECT_EQ(*envelope->sequence, 7);
    EXPECT_EQ(*envelope->eventName, "MESSAGE_CREATE");
    EXPECT_EQ((*envelope->data)["content"], "split between two frames");
}

TEST(PayloadDecoder, JoinsCompleteStreamSplitBetweenFrames) {
    std::vector<uint8_t> compressed = compressWhole(R"({"op":0,"s":4,"t":"TYPING_START","d":{}})");
    auto middle = compressed.begin() + compressed.size() / 2;

    PayloadDecoder decoder;
    EXPECT_FALSE(decoder.decode(binaryFrame(compressed.begin(), middle)));

    auto envelope = decoder.decode(binaryFrame(middle, compressed.end()));
    ASSERT_TRUE(envelope);
    EXPECT_EQ(*envelope->sequence, 4);
    EXPECT_EQ(*envelope->eventName, "TYPING_START");
}
