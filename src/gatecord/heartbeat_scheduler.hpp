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

#ifndef GATECORD_HEARTBEAT_SCHEDULER_HPP
#define GATECORD_HEARTBEAT_SCHEDULER_HPP

#include <cstdint>                                  // uint64_t
#include <atomic>                                   // std::atomic
#include <functional>                               // std::function
#include <boost/asio/io_service.hpp>                // boost::asio::io_service
#include <boost/asio/deadline_timer.hpp>            // boost::asio::deadline_timer
#include <boost/asio/io_context_strand.hpp>         // boost::asio::io_service::strand

namespace Gatecord {
    /**
     *  Periodic liveness pings for one gateway connection.
     *
     *  Every intervalMs milliseconds: if previous heartbeat was acknowledged,
     *  marks heartbeat as awaiting acknowledgement and calls beat callback
     *  (which should actually send it); otherwise stops and calls timeout
     *  callback.
     *
     *  Timer completions are executed on strand passed to constructor, so
     *  all methods should be called from same strand too (except getters).
     */
    class HeartbeatScheduler {
    public:
        using BeatCallback    = std::function<void()>;
        using TimeoutCallback = std::function<void()>;

        HeartbeatScheduler(boost::asio::io_service::strand& strand);
        ~HeartbeatScheduler();

        HeartbeatScheduler(const HeartbeatScheduler&) = delete;
        HeartbeatScheduler& operator=(const HeartbeatScheduler&) = delete;

        /**
         *  Start heartbeating, first heartbeat is sent after intervalMs.
         *  Previous timer (if any) is stopped first.
         */
        void start(unsigned intervalMs, BeatCallback onBeat, TimeoutCallback onTimeout);

        /**
         *  Cancel pending heartbeat. Safe to call multiple times.
         */
        void stop() noexcept;

        /**
         *  Heartbeat acknowledged by server.
         */
        void acknowledge() noexcept;

        inline bool running() const noexcept {
            return running_;
        }

        inline bool awaitingAck() const noexcept {
            return awaitingAck_;
        }

        inline unsigned intervalMs() const noexcept {
            return intervalMs_;
        }
    private:
        void asyncWait();
        void tick();

        boost::asio::io_service::strand& strand;
        boost::asio::deadline_timer timer;

        BeatCallback onBeat;
        TimeoutCallback onTimeout;

        std::atomic<bool> running_{false};
        std::atomic<bool> awaitingAck_{false};
        std::atomic<unsigned> intervalMs_{0};

        // Incremented on every start/stop, timer completions from previous
        // generation are ignored even if they were already queued.
        uint64_t generation = 0;
    };
} // namespace Gatecord

#endif // GATECORD_HEARTBEAT_SCHEDULER_HPP
