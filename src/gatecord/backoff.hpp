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

#ifndef GATECORD_BACKOFF_HPP
#define GATECORD_BACKOFF_HPP

#include <chrono>   // std::chrono::milliseconds
#include <mutex>    // std::mutex
#include <random>   // std::mt19937

namespace Gatecord {
    /**
     *  Strategy used by \ref GatewayClient to choose how long to wait before
     *  reconnecting or re-identifying.
     */
    class BackoffPolicy {
    public:
        virtual ~BackoffPolicy() = default;

        /**
         *  Delay before next attempt.
         */
        virtual std::chrono::milliseconds nextDelay() = 0;
    };

    /**
     *  Uniformly distributed random delay in [minDelay, maxDelay], so that many
     *  clients disconnected at once don't come back at the same moment.
     */
    class JitteredBackoff : public BackoffPolicy {
    public:
        JitteredBackoff(std::chrono::milliseconds minDelay = std::chrono::milliseconds(1000),
                        std::chrono::milliseconds maxDelay = std::chrono::milliseconds(6000));

        std::chrono::milliseconds nextDelay() override;

        std::chrono::milliseconds minDelay() const { return minDelay_; }
        std::chrono::milliseconds maxDelay() const { return maxDelay_; }
    private:
        std::chrono::milliseconds minDelay_, maxDelay_;

        std::mutex generatorMutex;
        std::mt19937 generator;
    };

    /**
     *  Always the same delay.
     */
    class FixedBackoff : public BackoffPolicy {
    public:
        explicit FixedBackoff(std::chrono::milliseconds delay) : delay(delay) {}

        std::chrono::milliseconds nextDelay() override { return delay; }
    private:
        std::chrono::milliseconds delay;
    };
} // namespace Gatecord

#endif // GATECORD_BACKOFF_HPP
