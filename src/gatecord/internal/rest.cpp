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

#include <gatecord/internal/rest.hpp>
#include <openssl/ssl.h>                                // SSL_set_tlsext_host_name
#include <openssl/err.h>                                // ERR_get_error
#include <boost/asio/connect.hpp>                       // boost::asio::connect
#include <boost/asio/ssl/error.hpp>                     // boost::asio::ssl::error::stream_truncated
#include <boost/asio/ssl/rfc2818_verification.hpp>      // boost::asio::ssl::rfc2818_verification
#include <boost/beast/core/flat_buffer.hpp>             // boost::beast::flat_buffer
#include <boost/beast/http/read.hpp>                    // boost::beast::http::read
#include <boost/beast/http/write.hpp>                   // boost::beast::http::write
#include <boost/beast/http/message.hpp>                 // boost::beast::http::request, response
#include <boost/beast/http/vector_body.hpp>             // boost::beast::http::vector_body
#include <boost/beast/http/error.hpp>                   // boost::beast::http::error::end_of_stream
#include <gatecord/config.hpp>
#include <gatecord/internal/utils.hpp>                  // Utils::stringToLower

#if defined(GATECORD_DEBUG_LOG)
    #include <iostream>
    #define DEBUG_MSG(msg) do { std::cerr <<  "rest.cpp:" << __LINE__ << " " << (msg) << '\n'; } while (false)
#else
    #define DEBUG_MSG(msg)
#endif

namespace ssl = boost::asio::ssl;
using tcp = boost::asio::ip::tcp;

namespace Gatecord { namespace REST {

namespace _detail {
    std::size_t CaseInsensibleStringHash::operator()(const std::string& str) const {
        return std::hash<std::string>()(Utils::stringToLower(str));
    }

    bool CaseInsensibleStringEqual::operator()(const std::string& lhs, const std::string& rhs) const {
        return Utils::stringToLower(lhs) == Utils::stringToLower(rhs);
    }
}

HTTPSConnection::HTTPSConnection(boost::asio::io_service& ioService, const std::string& serverName)
    : serverName(serverName)
    , ioService(ioService)
    , tlsctx(ssl::context::tlsv12_client)
    , stream(ioService, tlsctx) {

    tlsctx.set_default_verify_paths();
    stream.set_verify_mode(ssl::verify_peer | ssl::verify_fail_if_no_peer_cert);
    stream.set_verify_callback(ssl::rfc2818_verification(serverName));
}

void HTTPSConnection::open() {
    DEBUG_MSG(std::string("Opening HTTPS connection to ") + serverName);

    // Some servers (including Discord behind Cloudflare) refuse handshake without SNI.
    if (!SSL_set_tlsext_host_name(stream.native_handle(), serverName.c_str())) {
        throw boost::system::system_error(boost::system::error_code(static_cast<int>(::ERR_get_error()),
                                                                    boost::asio::error::get_ssl_category()));
    }

    tcp::resolver resolver(ioService);
    auto results = resolver.resolve(serverName, "https");

    boost::asio::connect(stream.next_layer(), results);
    stream.next_layer().set_option(tcp::no_delay(true));
    stream.handshake(ssl::stream_base::client);
    alive = true;
}

void HTTPSConnection::close() {
    DEBUG_MSG(std::string("Closing HTTPS connection to ") + serverName);

    boost::system::error_code ec;
    stream.shutdown(ec);
    if (ec &&
        ec != boost::asio::error::eof &&
        ec != boost::asio::ssl::error::stream_truncated &&
        ec != boost::asio::error::broken_pipe &&
        ec != boost::asio::error::connection_reset) {

        throw boost::system::system_error(ec);
    }
    stream.next_layer().close(ec);
    alive = false;
}

bool HTTPSConnection::isOpen() const {
    return stream.lowest_layer().is_open() && alive;
}

HTTPResponse HTTPSConnection::request(const HTTPRequest& request) {
    //
    // Prepare request
    //
    boost::beast::http::request<boost::beast::http::vector_body<uint8_t> > rawRequest;

    rawRequest.method_string(request.method);
    rawRequest.target(request.path);
    rawRequest.version(request.version);

    // Set default headers.
    rawRequest.set("User-Agent", "Gatecord/" GATECORD_VERSION);
    rawRequest.set("Connection", "keep-alive");
    rawRequest.set("Accept",     "*/*");
    rawRequest.set("Host",       serverName);
    if (!request.body.empty()) {
        rawRequest.set("Content-Type", "application/octet-stream");
    }

    // Set per-connection headers.
    for (const auto& header : connectionHeaders) {
        rawRequest.set(header.first, header.second);
    }

    // Set per-request headers.
    for (const auto& header : request.headers) {
        rawRequest.set(header.first, header.second);
    }

    rawRequest.body() = request.body;

    //
    // Perform request.
    //
    boost::system::error_code ec;

    rawRequest.prepare_payload();
    alive = false;
    boost::beast::http::write(stream, rawRequest, ec);
    if (ec) throw boost::system::system_error(ec);

    boost::beast::http::response<boost::beast::http::vector_body<uint8_t> > response;
    boost::beast::flat_buffer buffer;
    boost::beast::http::read(stream, buffer, response);

    HTTPResponse responseStruct;
    responseStruct.statusCode = response.result_int();
    responseStruct.body       = response.body();
    for (const auto& header : response) {
        auto name  = header.name_string();
        auto value = header.value();
        responseStruct.headers.insert({ std::string(name.data(), name.size()),
                                        std::string(value.data(), value.size()) });
    }
    alive = response.keep_alive();

    return responseStruct;
}

}} // namespace Gatecord::REST
