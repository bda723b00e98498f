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

#ifndef GATECORD_WSS_HPP
#define GATECORD_WSS_HPP

#include <string>                               // std::string
#include <deque>                                // std::deque
#include <memory>                               // std::enable_shared_from_this
#include <atomic>                               // std::atomic<bool>
#include <boost/beast/core/flat_buffer.hpp>     // boost::beast::flat_buffer
#include <boost/beast/websocket/stream.hpp>     // websocket::stream
#include <boost/beast/websocket/ssl.hpp>        // required to use ssl::stream beyond websocket
#include <boost/asio/ip/tcp.hpp>                // tcp::socket, tcp::resolver
#include <boost/asio/io_service.hpp>            // asio::io_service
#include <boost/asio/io_context_strand.hpp>     // asio::io_service::strand
#include <boost/asio/ssl/context.hpp>           // ssl::context
#include <boost/asio/ssl/stream.hpp>            // ssl::stream
#include <gatecord/gateway_socket.hpp>          // GatewaySocket

/**
 *  \file wss.hpp
 *  \internal
 *
 *  Asynchronous \ref GatewaySocket on top of low-level boost.beast.
 */

namespace Gatecord {
    namespace ssl       = boost::asio::ssl;
    namespace websocket = boost::beast::websocket;

    /**
     *  \internal
     *
     *  TLS WebSocket client. All I/O operations are serialized using own strand,
     *  so public methods can be called from any thread.
     *
     *  \warning TLSWebSocket *MUST* be allocated in heap and stored
     *           in std::shared_ptr, pending operations hold ownership.
     */
    class TLSWebSocket : public GatewaySocket, public std::enable_shared_from_this<TLSWebSocket> {
        using TLSStream = ssl::stream<boost::asio::ip::tcp::socket>;
        using WSSStream = websocket::stream<TLSStream>;
        using IOService = boost::asio::io_service;
        using tcp = boost::asio::ip::tcp;
    public:
        /**
         *  \internal
         *
         *  Construct unconnected WebSocket. Use open for connection.
         */
        TLSWebSocket(IOService& ioService);

        void open(const std::string& url, Callbacks callbacks) override;
        void send(const std::string& text) override;
        void close(int code) override;

        bool isOpen() const override {
            return open_;
        }
    private:
        void onResolve(const boost::system::error_code& ec, tcp::resolver::results_type results);
        void onConnect(const boost::system::error_code& ec);
        void onTLSHandshake(const boost::system::error_code& ec);
        void onWSHandshake(const boost::system::error_code& ec);

        void asyncRead();
        void asyncWrite();

        // Report error and close, invoked at most once per socket.
        void fail(const boost::system::error_code& ec, const std::string& what);
        void notifyClose(int code, const std::string& reason);

        IOService::strand strand;
        tcp::resolver resolver;
        ssl::context tlsContext;
        WSSStream wsStream;
        boost::beast::flat_buffer readBuffer;

        std::deque<std::string> outbox;
        bool writing = false;
        std::atomic<bool> open_{false};
        bool closing = false;

        std::string servername, target;
        Callbacks callbacks;
    };
}

#endif // GATECORD_WSS_HPP
