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

#ifndef GATECORD_EXCEPTIONS_HPP
#define GATECORD_EXCEPTIONS_HPP

#include <stdexcept>
#include <string>
#include <boost/system/system_error.hpp>

/**
 * \file exceptions.hpp
 *
 * This file defines set of exceptions thrown by Gatecord.
 */

namespace Gatecord {
    using ConnectionError = boost::system::system_error;

    /// Base class for errors that can't be predicted in most cases.
    class RuntimeError : public std::runtime_error {
    public:
        RuntimeError(const std::string& message, int errorCode)
            : std::runtime_error(message), message(message), code(errorCode) {}

        const std::string message;
        const int         code;
    };

    /// Base class for errors that can be predicted in most cases.
    class LogicError : public std::logic_error {
    public:
        LogicError(const std::string& message, int errorCode)
            : std::logic_error(message), message(message), code(errorCode) {}

        const std::string message;
        const int         code;
    };

    /**
     *  Gateway API error (unrecoverable disconnect, unusable session, etc).
     *
     *  \ref code contains gateway close code if error caused
     *  by disconnection, -1 otherwise.
     */
    class GatewayError : public RuntimeError {
    public:
        GatewayError(const std::string& message, int closeCode = -1)
            : RuntimeError(message, closeCode) {}
    };

    /// Received gateway payload doesn't have expected structure.
    class ProtocolError : public RuntimeError {
    public:
        ProtocolError(const std::string& message)
            : RuntimeError(message, -1) {}
    };

    /// Compressed gateway frame can't be inflated, code is zlib status.
    class ZlibError : public RuntimeError {
    public:
        ZlibError(const std::string& message, int zlibStatus)
            : RuntimeError(message, zlibStatus) {}
    };

    /// The class for errors in REST API.
    /// Some errors have separate classes, which inherit RESTError.
    class RESTError : public LogicError {
    public:
       RESTError(const std::string& message = "Unknown REST API error", int errorCode = -1, int httpCode = -1)
           : LogicError(message, errorCode), httpCode(httpCode) {}

       const int httpCode;
    };

    /// Thrown when API rejects token (HTTP 401).
    class AuthenticationError : public RESTError {
    public:
        AuthenticationError(const std::string& message = "Invalid token")
            : RESTError(message, -1, 401) {}
    };

    /// Thrown on REST API ratelimit hit, retryAfter contains delay in seconds
    /// as reported by API (0 if not reported).
    class RatelimitHit : public RESTError {
    public:
        RatelimitHit(const std::string& route, double retryAfter)
            : RESTError(std::string("Ratelimit hit for route ") + route +
                        ", retry after " + std::to_string(retryAfter) + " s", -1, 429)
            , retryAfter(retryAfter) {}

        const double retryAfter;
    };

    /// Thrown if either pre-request parameter validation fails or server returns
    /// message about invalid parameter.
    /// Errors parameter contained in \ref parameter, error description in \ref description.
    class InvalidParameter : public LogicError {
    public:
        InvalidParameter(const std::string& parameter, const std::string& description)
            : LogicError(std::string("Invalid parameter: ") + parameter + ", " + description, -1)
            , parameter(parameter)
            , description(description) {}

        const std::string parameter;
        const std::string description;
    };
} // namespace Gatecord

#endif // GATECORD_EXCEPTIONS_HPP
