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

#include <gatecord/heartbeat_scheduler.hpp>
#include <string>                                       // std::string, std::to_string
#include <boost/asio/error.hpp>                         // boost::asio::error::operation_aborted
#include <boost/date_time/posix_time/posix_time_types.hpp> // boost::posix_time::milliseconds
#include <gatecord/config.hpp>

#if defined(GATECORD_DEBUG_LOG)
    #include <iostream>
    #define DEBUG_MSG(msg) do { std::cerr <<  "heartbeat_scheduler.cpp:" << __LINE__ << " " << (msg) << '\n'; } while (false)
#else
    #define DEBUG_MSG(msg)
#endif

namespace Gatecord {

HeartbeatScheduler::HeartbeatScheduler(boost::asio::io_service::strand& strand)
    : strand(strand)
    , timer(strand.context()) {}

HeartbeatScheduler::~HeartbeatScheduler() {
    stop();
}

void HeartbeatScheduler::start(unsigned intervalMs, BeatCallback onBeat, TimeoutCallback onTimeout) {
    stop();

    DEBUG_MSG(std::string("Starting heartbeat, interval=") + std::to_string(intervalMs) + " ms.");
    this->onBeat    = std::move(onBeat);
    this->onTimeout = std::move(onTimeout);
    intervalMs_     = intervalMs;
    awaitingAck_    = false;
    running_        = true;

    asyncWait();
}

void HeartbeatScheduler::stop() noexcept {
    ++generation;
    running_     = false;
    awaitingAck_ = false;

    boost::system::error_code ignored;
    timer.cancel(ignored);
}

void HeartbeatScheduler::acknowledge() noexcept {
    DEBUG_MSG("Heartbeat acknowledged.");
    awaitingAck_ = false;
}

void HeartbeatScheduler::asyncWait() {
    uint64_t currentGeneration = generation;

    timer.expires_from_now(boost::posix_time::milliseconds(intervalMs_.load()));
    timer.async_wait(strand.wrap([this, currentGeneration](const boost::system::error_code& ec) {
        if (ec == boost::asio::error::operation_aborted) return;
        if (currentGeneration != generation || !running_) return;

        tick();
    }));
}

void HeartbeatScheduler::tick() {
    if (awaitingAck_) {
        DEBUG_MSG("Missing heartbeat acknowledgement.");
        running_ = false;
        ++generation;
        if (onTimeout) onTimeout();
        return;
    }

    awaitingAck_ = true;
    uint64_t currentGeneration = generation;
    if (onBeat) onBeat();

    // Callback may stop or restart us.
    if (running_ && currentGeneration == generation) asyncWait();
}

} // namespace Gatecord
