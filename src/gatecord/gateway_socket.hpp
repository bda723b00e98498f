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

#ifndef GATECORD_GATEWAY_SOCKET_HPP
#define GATECORD_GATEWAY_SOCKET_HPP

#include <cstdint>                      // uint8_t
#include <string>                       // std::string
#include <vector>                       // std::vector
#include <memory>                       // std::shared_ptr
#include <functional>                   // std::function
#include <boost/asio/io_service.hpp>    // boost::asio::io_service
#include <boost/system/error_code.hpp>  // boost::system::error_code

/**
 *  \file gateway_socket.hpp
 *
 *  Message-framed transport used by \ref GatewayClient.
 */

namespace Gatecord {
    /**
     *  Single WebSocket message. Text frames contain JSON, binary frames
     *  contain zlib-compressed JSON.
     */
    struct GatewayFrame {
        bool binary = false;
        std::vector<uint8_t> bytes;
    };

    /**
     *  Abstract bidirectional transport.
     *
     *  All methods are asynchronous and return immediately. Callbacks are
     *  invoked from I/O service threads. Implementation must guarantee that
     *  onClose is invoked at most once and after it no callbacks are invoked.
     *  Failed open must be reported as onError followed by onClose.
     */
    class GatewaySocket {
    public:
        /// Close code passed to onClose when connection dropped without Close frame.
        static constexpr int NoCloseCode = -1;

        struct Callbacks {
            std::function<void()> onOpen;
            std::function<void(const GatewayFrame&)> onMessage;
            std::function<void(int closeCode, const std::string& reason)> onClose;
            std::function<void(const boost::system::error_code&)> onError;
        };

        virtual ~GatewaySocket() = default;

        /**
         *  Start connecting to url (wss://host[:port]/target).
         */
        virtual void open(const std::string& url, Callbacks callbacks) = 0;

        /**
         *  Queue text message for sending.
         */
        virtual void send(const std::string& text) = 0;

        /**
         *  Send Close frame with code and tear down connection. Callbacks are
         *  not invoked after this call.
         */
        virtual void close(int code) = 0;

        virtual bool isOpen() const = 0;
    };

    using SocketFactory = std::function<std::shared_ptr<GatewaySocket>(boost::asio::io_service&)>;

    /**
     *  Default \ref SocketFactory, creates TLS WebSocket on top of boost.beast.
     */
    std::shared_ptr<GatewaySocket> makeTLSWebSocket(boost::asio::io_service& ioService);
} // namespace Gatecord

#endif // GATECORD_GATEWAY_SOCKET_HPP
