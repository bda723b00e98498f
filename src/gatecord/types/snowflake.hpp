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

#ifndef GATECORD_TYPES_SNOWFLAKE_HPP
#define GATECORD_TYPES_SNOWFLAKE_HPP

#include <cstdint>                     // uint64_t
#include <ctime>                       // time_t
#include <string>                      // std::string, std::stoull
#include <functional>                  // std::hash
#include <nlohmann/json.hpp>           // nlohmann::json

namespace Gatecord {
    /**
     *  Discord unique ID. API sends them as strings, so \ref from_json
     *  accepts both string and integer representations.
     */
    struct Snowflake {
        constexpr Snowflake() : value(0) {}
        constexpr Snowflake(uint64_t value) : value(value) {}
        explicit Snowflake(const std::string& strvalue) : value(std::stoull(strvalue)) {}
        explicit Snowflake(const char* strvalue) : value(std::stoull(strvalue)) {}

        uint64_t value;

        static constexpr uint64_t discordEpochMs = 1420070400000;

        inline constexpr unsigned long long unixTimestampMs() const {
            return (value >> 22) + discordEpochMs;
        }

        inline constexpr time_t unixTimestamp() const {
            return static_cast<time_t>(unixTimestampMs() / 1000);
        }

        inline constexpr operator uint64_t() const { return value; }
    };

    inline void to_json(nlohmann::json& json, const Snowflake& snowflake) {
        json = std::to_string(snowflake.value);
    }

    inline void from_json(const nlohmann::json& json, Snowflake& snowflake) {
        if (json.is_string()) {
            snowflake.value = std::stoull(json.get<std::string>());
        } else {
            snowflake.value = json.get<uint64_t>();
        }
    }
} // namespace Gatecord

namespace std {
    template<>
    class hash<Gatecord::Snowflake> {
    public:
        inline size_t operator()(const Gatecord::Snowflake& snowflake) const {
            return std::hash<uint64_t>()(snowflake.value);
        }
    };
}

#endif // GATECORD_TYPES_SNOWFLAKE_HPP
