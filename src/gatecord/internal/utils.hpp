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

#ifndef GATECORD_UTILS_HPP
#define GATECORD_UTILS_HPP

#include <string>
#include <unordered_map>

/**
 *  Reusable code snippets.
 */

namespace Gatecord { namespace Utils {
    /**
     *  Components of absolute URL.
     *
     *  scheme://host:port/target?query -> { scheme, host, port, "/target?query" }
     */
    struct Url {
        std::string scheme;
        std::string host;
        unsigned short port;
        std::string target;
    };

    /**
     *  Split absolute URL into components. Port defaults to 443 for
     *  https/wss and 80 for http/ws, target defaults to "/".
     *
     *  \throws std::invalid_argument if URL is malformed.
     */
    Url parseUrl(const std::string& url);

    std::string urlEncode(const std::string& raw);
    std::string makeQueryString(const std::unordered_map<std::string, std::string>& queryVariables);

    std::string stringToLower(const std::string& input);

    /**
     *  Name of OS library was compiled for, sent in Identify payload.
     */
    const char* osName();
}} // namespace Gatecord::Utils

#endif // GATECORD_UTILS_HPP
