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

#include <gatecord/backoff.hpp>
#include <gatecord/exceptions.hpp>

namespace Gatecord {

JitteredBackoff::JitteredBackoff(std::chrono::milliseconds minDelay, std::chrono::milliseconds maxDelay)
    : minDelay_(minDelay)
    , maxDelay_(maxDelay)
    , generator(std::random_device()()) {

    if (minDelay.count() < 0 || maxDelay < minDelay) {
        throw InvalidParameter("maxDelay", "delay range should be non-negative and maxDelay >= minDelay.");
    }
}

std::chrono::milliseconds JitteredBackoff::nextDelay() {
    std::uniform_int_distribution<std::chrono::milliseconds::rep> distribution(minDelay_.count(), maxDelay_.count());

    std::lock_guard<std::mutex> lock(generatorMutex);
    return std::chrono::milliseconds(distribution(generator));
}

} // namespace Gatecord
