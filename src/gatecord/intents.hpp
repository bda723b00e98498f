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

#ifndef GATECORD_INTENTS_HPP
#define GATECORD_INTENTS_HPP

#include <cstdint>
#include <gatecord/flag.hpp>

namespace Gatecord {
    /**
     *  Gateway intents, requested in Identify payload. Server delivers only
     *  events from requested categories.
     *
     *  Filled according to https://discord.com/developers/docs/topics/gateway#gateway-intents
     *
     *  GuildMembers, GuildPresences and MessageContent are privileged and
     *  should be enabled in application settings.
     */
    enum Intent : uint32_t {
        Guilds                      = 1u << 0,
        GuildMembers                = 1u << 1,  /// Privileged.
        GuildModeration             = 1u << 2,
        GuildEmojisAndStickers      = 1u << 3,
        GuildIntegrations           = 1u << 4,
        GuildWebhooks               = 1u << 5,
        GuildInvites                = 1u << 6,
        GuildVoiceStates            = 1u << 7,
        GuildPresences              = 1u << 8,  /// Privileged.
        GuildMessages               = 1u << 9,
        GuildMessageReactions       = 1u << 10,
        GuildMessageTyping          = 1u << 11,
        DirectMessages              = 1u << 12,
        DirectMessageReactions      = 1u << 13,
        DirectMessageTyping         = 1u << 14,
        MessageContent              = 1u << 15, /// Privileged.
        GuildScheduledEvents        = 1u << 16,
        AutoModerationConfiguration = 1u << 20,
        AutoModerationExecution     = 1u << 21,
    };

    using Intents = Flags<Intent, uint32_t>;
    GATECORD_DECLARE_FLAGS_OPERATORS(Intent, uint32_t)
} // namespace Gatecord

#endif // GATECORD_INTENTS_HPP
