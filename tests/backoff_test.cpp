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

#include <gtest/gtest.h>
#include <gatecord/backoff.hpp>
#include <gatecord/exceptions.hpp>

using namespace Gatecord;

TEST(Backoff, JitteredDelayWithinRange) {
    JitteredBackoff backoff;
    EXPECT_EQ(backoff.minDelay().count(), 1000);
    EXPECT_EQ(backoff.maxDelay().count(), 6000);

    for (int i = 0; i < 1000; ++i) {
        auto delay = backoff.nextDelay().count();
        EXPECT_GE(delay, 1000);
        EXPECT_LE(delay, 6000);
    }
}

TEST(Backoff, JitteredRejectsInvalidRange) {
    EXPECT_THROW(JitteredBackoff(std::chrono::milliseconds(500), std::chrono::milliseconds(100)), InvalidParameter);
    EXPECT_THROW(JitteredBackoff(std::chrono::milliseconds(-1), std::chrono::milliseconds(100)), InvalidParameter);
}

TEST(Backoff, FixedDelay) {
    FixedBackoff backoff(std::chrono::milliseconds(250));
    EXPECT_EQ(backoff.nextDelay().count(), 250);
    EXPECT_EQ(backoff.nextDelay().count(), 250);
}
