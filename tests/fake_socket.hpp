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

#ifndef GATECORD_TESTS_FAKE_SOCKET_HPP
#define GATECORD_TESTS_FAKE_SOCKET_HPP

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include <gatecord/gateway_socket.hpp>

namespace Gatecord { namespace Testing {
    /**
     *  In-memory GatewaySocket. Records everything sent, server side is
     *  simulated by calling receive/simulateOpen/simulateClose.
     */
    class FakeSocket : public GatewaySocket {
    public:
        void open(const std::string& url, Callbacks callbacks) override {
            this->url       = url;
            this->callbacks = callbacks;
            openCalled      = true;
        }

        void send(const std::string& text) override {
            sent.push_back(text);
        }

        void close(int code) override {
            closeCode = code;
            open_     = false;
            callbacks = Callbacks();
        }

        bool isOpen() const override {
            return open_;
        }

        void simulateOpen() {
            open_ = true;
            if (callbacks.onOpen) callbacks.onOpen();
        }

        void receive(const nlohmann::json& payload) {
            std::string text = payload.dump();

            GatewayFrame frame;
            frame.bytes.assign(text.begin(), text.end());
            receive(frame);
        }

        void receive(const GatewayFrame& frame) {
            if (callbacks.onMessage) callbacks.onMessage(frame);
        }

        void simulateClose(int code, const std::string& reason = "") {
            open_ = false;
            auto onClose = callbacks.onClose;
            callbacks = Callbacks();
            if (onClose) onClose(code, reason);
        }

        std::vector<nlohmann::json> sentPayloads() const {
            std::vector<nlohmann::json> result;
            for (const std::string& text : sent) {
                result.push_back(nlohmann::json::parse(text));
            }
            return result;
        }

        std::vector<nlohmann::json> sentWithOpcode(int opcode) const {
            std::vector<nlohmann::json> result;
            for (const nlohmann::json& payload : sentPayloads()) {
                if (payload["op"] == opcode) result.push_back(payload);
            }
            return result;
        }

        std::string url;
        Callbacks callbacks;
        std::vector<std::string> sent;
        bool openCalled = false;
        int closeCode = NoCloseCode;
    private:
        bool open_ = false;
    };
}} // namespace Gatecord::Testing

#endif // GATECORD_TESTS_FAKE_SOCKET_HPP
