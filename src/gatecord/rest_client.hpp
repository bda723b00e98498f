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

#ifndef GATECORD_REST_CLIENT_HPP
#define GATECORD_REST_CLIENT_HPP

#include <string>                           // std::string
#include <utility>                          // std::pair
#include <memory>                           // std::unique_ptr
#include <mutex>                            // std::mutex
#include <unordered_map>                    // std::unordered_map
#include <boost/asio/io_service.hpp>        // boost::asio::io_service
#include <nlohmann/json.hpp>                // nlohmann::json
#include <gatecord/internal/rest.hpp>       // REST::HTTPSConnection, REST::HTTPResponse

/**
 * \file rest_client.hpp
 *  Defines \ref Gatecord::RestClient class.
 */

namespace Gatecord {
    class RestClient {
    public:
        static constexpr const char* serverName   = "discord.com";
        static constexpr const char* restBasePath = "/api/v10";

        /**
         * Construct RestClient, does nothing network-related to make RestClient's cheap
         * to construct.
         * \param ioService ASIO I/O service. Should not be destroyed while
         *                  RestClient exists.
         * \param token     bot token, don't add "Bot " prefix.
         */
        RestClient(boost::asio::io_service& ioService, const std::string& token);

        RestClient(const RestClient&) = delete;
        RestClient& operator=(const RestClient&) = delete;

        /**
         * Return gateway URL to be used in \ref GatewayConfig and recommended
         * shards count.
         */
        std::pair<std::string, int> getGatewayUrlBot();

        /**
         * Send raw REST-request and return result json.
         * \note Newly constructed RestClient object don't have open REST
         *       connection. It will be opened when sendRestRequest called
         *       first time.
         * \param method    used HTTP method, can be any string without spaces
         *                  but following used by Discord API: "POST", "GET",
         *                  "PATCH", "PUT", "DELETE".
         * \param endpoint  endpoint URL relative to base URL (including leading slash).
         * \param payload   JSON payload, pass null (default) if none.
         * \param query     GET request query.
         * \throws RESTError (or derived class) on API error.
         * \throws boost::system::system_error on connection problem.
         *
         * Thread-safe, concurrent requests are serialized.
         */
        nlohmann::json sendRestRequest(const std::string& method, const std::string& endpoint,
                                       const nlohmann::json& payload = {},
                                       const std::unordered_map<std::string, std::string>& query = {});

        /**
         * Translate HTTP response into result JSON or exception.
         *
         * 2xx gives parsed body (null for empty body, body as JSON string
         * if it is not JSON). 401 throws AuthenticationError, 429 throws
         * RatelimitHit, any other status throws RESTError.
         */
        static nlohmann::json parseResponse(const REST::HTTPResponse& response,
                                            const std::string& route = "");

        inline const std::string& token() const {
            return token_;
        }
    private:
        REST::HTTPRequest prepareRequest(const std::string& method, const std::string& endpoint,
                                         const nlohmann::json& payload,
                                         const std::unordered_map<std::string, std::string>& query) const;
        void reopenConnection();

        std::mutex connectionMutex;
        std::unique_ptr<REST::HTTPSConnection> restConnection;

        const std::string token_;
        boost::asio::io_service& ioService; // non-owning reference to I/O service.
    };
} // namespace Gatecord

#endif // GATECORD_REST_CLIENT_HPP
