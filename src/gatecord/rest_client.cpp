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

#include <gatecord/rest_client.hpp>
#include <stdexcept>                                   // std::logic_error
#include <boost/beast/http/error.hpp>                 // boost::beast::http::error::end_of_stream
#include <boost/asio/error.hpp>                       // boost::asio::error::broken_pipe
#include <gatecord/config.hpp>
#include <gatecord/exceptions.hpp>
#include <gatecord/internal/utils.hpp>                // Utils::makeQueryString

#if defined(GATECORD_DEBUG_LOG)
    #include <iostream>
    #define DEBUG_MSG(msg) do { std::cerr <<  "rest_client.cpp:" << __LINE__ << " " << (msg) << '\n'; } while (false)
#else
    #define DEBUG_MSG(msg)
#endif

namespace Gatecord {
    constexpr const char* RestClient::serverName;
    constexpr const char* RestClient::restBasePath;

    RestClient::RestClient(boost::asio::io_service& ioService, const std::string& token)
        : token_(token)
        , ioService(ioService) {

        reopenConnection();
    }

    void RestClient::reopenConnection() {
        restConnection.reset(new REST::HTTPSConnection(ioService, serverName));

        // Discord API requires "DiscordBot" user-agent,
        // see https://discord.com/developers/docs/reference#user-agent
        restConnection->connectionHeaders.insert({ "User-Agent", "DiscordBot (" GATECORD_GITHUB ", " GATECORD_VERSION ")" });
        restConnection->connectionHeaders.insert({ "Authorization", std::string("Bot ") + token_ });
    }

    std::pair<std::string, int> RestClient::getGatewayUrlBot() {
        nlohmann::json response = sendRestRequest("GET", "/gateway/bot");
        return { response.at("url").get<std::string>(), response.at("shards").get<int>() };
    }

    REST::HTTPRequest RestClient::prepareRequest(const std::string& method, const std::string& endpoint,
                                                 const nlohmann::json& payload,
                                                 const std::unordered_map<std::string, std::string>& query) const {
        REST::HTTPRequest request;

        request.method  = method;
        request.path    = std::string(restBasePath) + endpoint + Utils::makeQueryString(query);
        request.version = 11;

        request.headers.insert({ "Accept", "application/json" });

        if (!payload.is_null()) {
            request.headers["Content-Type"] = "application/json";

            std::string jsonStr = payload.dump();
            request.body = std::vector<uint8_t>(jsonStr.begin(), jsonStr.end());
        }
        return request;
    }

    nlohmann::json RestClient::sendRestRequest(const std::string& method, const std::string& endpoint,
                                               const nlohmann::json& payload,
                                               const std::unordered_map<std::string, std::string>& query) {

        REST::HTTPRequest request = prepareRequest(method, endpoint, payload, query);

        std::lock_guard<std::mutex> lock(connectionMutex);

        REST::HTTPResponse response;
        bool retried = false;
        while (true) {
            if (!restConnection->isOpen()) {
                try {
                    restConnection->open();
                } catch (boost::system::system_error&) {
                    // Half-open connection can't be reused.
                    reopenConnection();
                    throw;
                }
            }

            try {
                DEBUG_MSG(std::string("Sending REST request: ") + method + " " + request.path + " " + payload.dump());
                response = restConnection->request(request);
                break;
            } catch (boost::system::system_error& excp) {
                if (retried ||
                    (excp.code() != boost::beast::http::error::end_of_stream &&
                     excp.code() != boost::asio::error::broken_pipe &&
                     excp.code() != boost::asio::error::connection_reset)) throw;

                DEBUG_MSG("HTTP Connection closed by remote. Reopenning and retrying.");
                reopenConnection();
                retried = true;
            }
        }

        if (!restConnection->isOpen()) {
            // Server asked to close connection, next request will use new one.
            reopenConnection();
        }

        return parseResponse(response, method + " " + endpoint);
    }

    nlohmann::json RestClient::parseResponse(const REST::HTTPResponse& response, const std::string& route) {
        nlohmann::json body;
        if (!response.body.empty()) {
            body = nlohmann::json::parse(response.body.begin(), response.body.end(), nullptr, /* allow_exceptions: */ false);
            if (body.is_discarded()) {
                body = std::string(response.body.begin(), response.body.end());
            }
        }

        if (response.statusCode / 100 == 2) {
            return body;
        }

        DEBUG_MSG(std::string("Got non-2xx HTTP status code: ") + std::to_string(response.statusCode));
        DEBUG_MSG(body.dump());

        std::string message;
        int code = -1;
        if (body.is_object()) {
            auto messageIt = body.find("message");
            if (messageIt != body.end() && messageIt->is_string()) message = messageIt->get<std::string>();

            auto codeIt = body.find("code");
            if (codeIt != body.end() && codeIt->is_number_integer()) code = codeIt->get<int>();
        }

        if (response.statusCode == 401) {
            if (message.empty()) throw AuthenticationError();
            throw AuthenticationError(message);
        }

        if (response.statusCode == 429) {
            double retryAfter = 0.0;
            if (body.is_object() && body.count("retry_after") && body["retry_after"].is_number()) {
                retryAfter = body["retry_after"].get<double>();
            } else {
                auto headerIt = response.headers.find("Retry-After");
                if (headerIt != response.headers.end()) {
                    try {
                        retryAfter = std::stod(headerIt->second);
                    } catch (std::logic_error&) {
                        DEBUG_MSG(std::string("Invalid Retry-After header: ") + headerIt->second);
                    }
                }
            }
            throw RatelimitHit(route, retryAfter);
        }

        if (message.empty()) {
            message = std::string("HTTP ") + std::to_string(response.statusCode);
        }
        throw RESTError(message, code, static_cast<int>(response.statusCode));
    }
} // namespace Gatecord
