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

#include <gatecord/internal/utils.hpp>
#include <cctype>       // std::isalnum, std::isdigit
#include <locale>       // std::tolower, std::locale
#include <stdexcept>    // std::invalid_argument
#include <sstream>      // std::ostringstream
#include <iomanip>      // std::setw

// All we need is C++11 compatibile compiler and boost libraries so we can probably run on a lot of platforms.
#if defined(__linux__) || defined(__linux) || defined(linux) || defined(__GNU__)
    #define OS_STR "linux"
#elif defined(__FreeBSD__) || defined(__NetBSD__) || defined(__OpenBSD__) || defined(__DragonFly__)
    #define OS_STR "bsd"
#elif defined(_WIN32) || defined(__WIN32__) || defined(WIN32)
    #define OS_STR "win32"
#elif defined(macintosh) || defined(__APPLE__) || defined(__APPLE_CC__)
    #define OS_STR "macos"
#elif defined(__unix__) || defined (__unix) || defined(_XOPEN_SOURCE) || defined(_POSIX_SOURCE)
    #define OS_STR "unix"
#else
    #define OS_STR "unknown"
#endif

namespace Gatecord { namespace Utils {

    Url parseUrl(const std::string& url) {
        enum State {
            ReadingSchema,
            ReadingSchema_Colon,
            ReadingSchema_FirstSlash,
            ReadingHost,
            ReadingPort,
            ReadingTarget,
            SkippingFragment
        } state = ReadingSchema;

        Url result;
        std::string port;
        for (char ch : url) {
            switch (state) {
            case ReadingSchema:
                if (ch == ':') {
                    if (result.scheme.empty()) throw std::invalid_argument("Empty schema.");
                    state = ReadingSchema_Colon;
                } else if (std::isalnum(static_cast<unsigned char>(ch)) || ch == '+' || ch == '-' || ch == '.') {
                    result.scheme += std::tolower(ch, std::locale::classic());
                } else {
                    throw std::invalid_argument("Missing colon after schema.");
                }
                break;
            case ReadingSchema_Colon:
                if (ch != '/') throw std::invalid_argument("Missing slash after schema.");
                state = ReadingSchema_FirstSlash;
                break;
            case ReadingSchema_FirstSlash:
                if (ch != '/') throw std::invalid_argument("Missing slash after schema.");
                state = ReadingHost;
                break;
            case ReadingHost:
                if (ch == ':') {
                    state = ReadingPort;
                } else if (ch == '/' || ch == '?') {
                    result.target += ch;
                    state = ReadingTarget;
                } else if (ch == '#') {
                    state = SkippingFragment;
                } else if (std::isalnum(static_cast<unsigned char>(ch)) || ch == '-' || ch == '_' || ch == '.') {
                    result.host += ch;
                } else {
                    throw std::invalid_argument("Invalid domain character.");
                }
                break;
            case ReadingPort:
                if (std::isdigit(static_cast<unsigned char>(ch))) {
                    port += ch;
                } else if (ch == '/' || ch == '?') {
                    result.target += ch;
                    state = ReadingTarget;
                } else {
                    throw std::invalid_argument("Invalid port character.");
                }
                break;
            case ReadingTarget:
                if (ch == '#') {
                    state = SkippingFragment;
                } else {
                    result.target += ch;
                }
                break;
            case SkippingFragment:
                break;
            }
        }

        if (state == ReadingSchema || state == ReadingSchema_Colon || state == ReadingSchema_FirstSlash) {
            throw std::invalid_argument("Incomplete URL.");
        }
        if (result.host.empty()) throw std::invalid_argument("Empty domain.");

        if (!port.empty()) {
            unsigned long value = std::stoul(port);
            if (value == 0 || value > 65535) throw std::invalid_argument("Port out of range.");
            result.port = static_cast<unsigned short>(value);
        } else if (result.scheme == "https" || result.scheme == "wss") {
            result.port = 443;
        } else if (result.scheme == "http" || result.scheme == "ws") {
            result.port = 80;
        } else {
            throw std::invalid_argument("Unknown schema and no port specified.");
        }

        if (result.target.empty() || result.target[0] == '?') {
            result.target.insert(result.target.begin(), '/');
        }
        return result;
    }

    std::string urlEncode(const std::string& raw) {
        std::ostringstream resultStream;

        resultStream.fill('0');
        resultStream << std::hex;

        for (char ch : raw) {
            if (std::isalnum(static_cast<unsigned char>(ch)) || ch == '.' || ch == '~' || ch == '_' || ch == '-') {
                resultStream << ch;
            } else {
                resultStream << std::uppercase;
                resultStream << '%' << std::setw(2) << int(static_cast<unsigned char>(ch));
                resultStream << std::nouppercase;
            }
        }
        return resultStream.str();
    }

    std::string makeQueryString(const std::unordered_map<std::string, std::string>& queryVariables) {
        if (queryVariables.empty()) return "";

        std::string result = "?";
        for (const auto& pair : queryVariables) {
            if (result.size() > 1) result += '&';
            result += urlEncode(pair.first) + "=" + urlEncode(pair.second);
        }
        return result;
    }

    std::string stringToLower(const std::string& input) {
        std::string result;
        result.reserve(input.size());

        for (char ch : input) {
            result.push_back(std::tolower(ch, std::locale::classic()));
        }
        return result;
    }

    const char* osName() {
        return OS_STR;
    }
}} // namespace Gatecord::Utils
