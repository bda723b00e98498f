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

#ifndef GATECORD_REST_HPP
#define GATECORD_REST_HPP

#include <cstdint>                      // uint8_t
#include <string>                       // std::string
#include <vector>                       // std::vector
#include <unordered_map>                // std::unordered_map
#include <boost/asio/io_service.hpp>    // boost::asio::io_service
#include <boost/asio/ssl/context.hpp>   // boost::asio::ssl::context
#include <boost/asio/ssl/stream.hpp>    // boost::asio::ssl::stream
#include <boost/asio/ip/tcp.hpp>        // boost::asio::ip::tcp::socket

namespace Gatecord { namespace REST {
    namespace _detail {
        struct CaseInsensibleStringHash {
            std::size_t operator()(const std::string& str) const;
        };

        struct CaseInsensibleStringEqual {
            bool operator()(const std::string& lhs, const std::string& rhs) const;
        };
    }

    /// Hash-map with case-insensible string keys.
    using HeadersMap = std::unordered_map<std::string, std::string,
                                          _detail::CaseInsensibleStringHash,
                                          _detail::CaseInsensibleStringEqual>;

    struct HTTPResponse {
        unsigned statusCode = 0;

        HeadersMap headers;
        std::vector<uint8_t> body;
    };

    struct HTTPRequest {
        std::string method;
        std::string path;

        unsigned version = 11;
        std::vector<uint8_t> body;
        HeadersMap headers;
    };

    /**
     *  Synchronous keep-alive HTTP/1.1 connection over TLS.
     *
     *  Once closed (by either side) object can't be reopened, create new one.
     */
    class HTTPSConnection {
    public:
        HTTPSConnection(boost::asio::io_service& ioService, const std::string& serverName);

        /**
         *  \throws boost::system::system_error on resolve, connect or handshake failure.
         */
        void open();
        void close();

        bool isOpen() const;

        /**
         *  \throws boost::system::system_error on I/O error.
         */
        HTTPResponse request(const HTTPRequest& request);

        /// Headers added to every request.
        HeadersMap connectionHeaders;
        const std::string serverName;

    private:
        boost::asio::io_service& ioService;
        boost::asio::ssl::context tlsctx;
        boost::asio::ssl::stream<boost::asio::ip::tcp::socket> stream;

        bool alive = false;
    };
}} // namespace Gatecord::REST

#endif // GATECORD_REST_HPP
