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

#include <gatecord/internal/wss.hpp>
#include <cstdint>                                  // std::uint16_t
#include <stdexcept>                                // std::invalid_argument
#include <openssl/err.h>                            // ERR_get_error
#include <boost/asio/connect.hpp>                   // boost::asio::async_connect
#include <boost/asio/buffer.hpp>                    // boost::asio::buffer
#include <boost/asio/ssl/error.hpp>                 // boost::asio::ssl::error
#include <boost/asio/ssl/rfc2818_verification.hpp>  // boost::asio::ssl::rfc2818_verification
#include <boost/beast/core/buffers_to_string.hpp>   // boost::beast::buffers_to_string
#include <boost/beast/http/field.hpp>               // boost::beast::http::field
#include <boost/beast/websocket/error.hpp>          // websocket::error::closed
#include <gatecord/config.hpp>
#include <gatecord/internal/utils.hpp>              // Utils::parseUrl

#if defined(GATECORD_DEBUG_LOG)
    #include <iostream>
    #define DEBUG_MSG(msg) do { std::cerr <<  "wss.cpp:" << __LINE__ << " " << (msg) << '\n'; } while (false)
#else
    #define DEBUG_MSG(msg)
#endif

namespace Gatecord {

    std::shared_ptr<GatewaySocket> makeTLSWebSocket(boost::asio::io_service& ioService) {
        return std::make_shared<TLSWebSocket>(ioService);
    }

    TLSWebSocket::TLSWebSocket(IOService& ioService)
        : strand(ioService)
        , resolver(ioService)
        , tlsContext(ssl::context::tlsv12_client)
        , wsStream(ioService, tlsContext) {

        tlsContext.set_default_verify_paths();
        tlsContext.set_verify_mode(ssl::verify_peer | ssl::verify_fail_if_no_peer_cert);
    }

    void TLSWebSocket::open(const std::string& url, TLSWebSocket::Callbacks callbacks) {
        auto self = shared_from_this();
        strand.dispatch([this, self, url, callbacks]() {
            this->callbacks = callbacks;

            Utils::Url parsedUrl;
            try {
                parsedUrl = Utils::parseUrl(url);
            } catch (std::invalid_argument& excp) {
                fail(boost::asio::error::invalid_argument, std::string("invalid gateway URL: ") + excp.what());
                return;
            }
            servername = parsedUrl.host;
            target     = parsedUrl.target;

            wsStream.next_layer().set_verify_callback(ssl::rfc2818_verification(servername));
            wsStream.set_option(websocket::stream_base::decorator([](websocket::request_type& request) {
                request.set(boost::beast::http::field::user_agent, "Gatecord/" GATECORD_VERSION);
            }));

            DEBUG_MSG(std::string("Resolving ") + servername + ":" + std::to_string(parsedUrl.port));
            resolver.async_resolve(servername, std::to_string(parsedUrl.port),
                strand.wrap([this, self](const boost::system::error_code& ec, tcp::resolver::results_type results) {
                    onResolve(ec, results);
                }));
        });
    }

    void TLSWebSocket::onResolve(const boost::system::error_code& ec, tcp::resolver::results_type results) {
        if (closing) return;
        if (ec) return fail(ec, "resolve");

        auto self = shared_from_this();
        boost::asio::async_connect(wsStream.next_layer().next_layer(), results,
            strand.wrap([this, self](const boost::system::error_code& ec, const tcp::endpoint&) {
                onConnect(ec);
            }));
    }

    void TLSWebSocket::onConnect(const boost::system::error_code& ec) {
        if (closing) return;
        if (ec) return fail(ec, "connect");

        wsStream.next_layer().next_layer().set_option(tcp::no_delay(true));

        // SNI is required by most of servers behind CDN.
        if (!SSL_set_tlsext_host_name(wsStream.next_layer().native_handle(), servername.c_str())) {
            return fail(boost::system::error_code(static_cast<int>(::ERR_get_error()),
                                                  boost::asio::error::get_ssl_category()), "SNI");
        }

        auto self = shared_from_this();
        wsStream.next_layer().async_handshake(ssl::stream_base::client,
            strand.wrap([this, self](const boost::system::error_code& ec) {
                onTLSHandshake(ec);
            }));
    }

    void TLSWebSocket::onTLSHandshake(const boost::system::error_code& ec) {
        if (closing) return;
        if (ec) return fail(ec, "TLS handshake");

        auto self = shared_from_this();
        wsStream.async_handshake(servername, target,
            strand.wrap([this, self](const boost::system::error_code& ec) {
                onWSHandshake(ec);
            }));
    }

    void TLSWebSocket::onWSHandshake(const boost::system::error_code& ec) {
        if (closing) return;
        if (ec) return fail(ec, "WebSocket handshake");

        DEBUG_MSG(std::string("Connected to ") + servername + target);
        open_ = true;
        if (callbacks.onOpen) callbacks.onOpen();

        asyncRead();
        if (!outbox.empty() && !writing) asyncWrite();
    }

    void TLSWebSocket::asyncRead() {
        auto self = shared_from_this();
        wsStream.async_read(readBuffer, strand.wrap([this, self](const boost::system::error_code& ec, std::size_t) {
            if (closing) return;

            if (ec == websocket::error::closed) {
                const websocket::close_reason& reason = wsStream.reason();
                open_ = false;
                notifyClose(static_cast<int>(reason.code), std::string(reason.reason.data(), reason.reason.size()));
                return;
            }
            if (ec) return fail(ec, "read");

            GatewayFrame frame;
            frame.binary = !wsStream.got_text();
            std::string data = boost::beast::buffers_to_string(readBuffer.data());
            frame.bytes.assign(data.begin(), data.end());
            readBuffer.consume(readBuffer.size());

            if (callbacks.onMessage) callbacks.onMessage(frame);

            asyncRead();
        }));
    }

    void TLSWebSocket::send(const std::string& text) {
        auto self = shared_from_this();
        strand.dispatch([this, self, text]() {
            if (closing) return;

            outbox.push_back(text);
            if (open_ && !writing) asyncWrite();
        });
    }

    void TLSWebSocket::asyncWrite() {
        writing = true;
        wsStream.text(true);

        auto self = shared_from_this();
        wsStream.async_write(boost::asio::buffer(outbox.front()),
            strand.wrap([this, self](const boost::system::error_code& ec, std::size_t) {
                writing = false;
                if (closing) return;
                if (ec) return fail(ec, "write");

                outbox.pop_front();
                if (!outbox.empty()) asyncWrite();
            }));
    }

    void TLSWebSocket::close(int code) {
        auto self = shared_from_this();
        strand.dispatch([this, self, code]() {
            if (closing) return;
            closing = true;
            callbacks = Callbacks();
            // Front message may be referenced by pending write.
            if (writing) {
                outbox.erase(outbox.begin() + 1, outbox.end());
            } else {
                outbox.clear();
            }

            boost::system::error_code ignored;
            if (!open_) {
                // Still connecting, just drop everything.
                resolver.cancel();
                wsStream.next_layer().next_layer().close(ignored);
                return;
            }

            open_ = false;
            DEBUG_MSG(std::string("Closing WebSocket, code=") + std::to_string(code));
            wsStream.async_close(websocket::close_reason(static_cast<std::uint16_t>(code)),
                strand.wrap([this, self](const boost::system::error_code& ec) {
                    if (ec &&
                        ec != boost::asio::ssl::error::stream_truncated &&
                        ec != boost::asio::error::broken_pipe &&
                        ec != boost::asio::error::connection_reset &&
                        ec != boost::asio::error::eof) {
                        DEBUG_MSG(std::string("Close failed: ") + ec.message());
                    }
                    boost::system::error_code ignored;
                    wsStream.next_layer().next_layer().close(ignored);
                }));
        });
    }

    void TLSWebSocket::fail(const boost::system::error_code& ec, const std::string& what) {
        DEBUG_MSG(what + ": " + ec.message());
        open_ = false;
        closing = true;

        boost::system::error_code ignored;
        wsStream.next_layer().next_layer().close(ignored);

        if (callbacks.onError) callbacks.onError(ec);
        notifyClose(NoCloseCode, what + ": " + ec.message());
    }

    void TLSWebSocket::notifyClose(int code, const std::string& reason) {
        Callbacks current = std::move(callbacks);
        callbacks = Callbacks();
        if (current.onClose) current.onClose(code, reason);
    }
} // namespace Gatecord
