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

#include <gatecord/internal/zlib.hpp>
#include <string>
#include <gatecord/exceptions.hpp>

// Closer to trivial message size => better.
constexpr size_t ZlibBufferSize = 16 * 1024;

namespace Gatecord {
namespace Zlib {

    InflateStream::InflateStream() {
        stream.zalloc = Z_NULL;
        stream.zfree = Z_NULL;
        stream.opaque = Z_NULL;
        stream.avail_in = 0;
        stream.next_in = Z_NULL;

        int status = inflateInit2(&stream, /* window bits: */ 15);
        if (status != Z_OK) {
            throw ZlibError(std::string("inflateInit2 failed: ") + (stream.msg ? stream.msg : zError(status)), status);
        }
    }

    InflateStream::~InflateStream() {
        inflateEnd(&stream);
    }

    void InflateStream::reset() {
        inflateReset(&stream);
        streamEnded_ = false;
    }

    bool endsWithSyncFlush(const std::vector<uint8_t>& data) {
        return data.size() >= 4 &&
               data[data.size() - 4] == 0x00 && data[data.size() - 3] == 0x00 &&
               data[data.size() - 2] == 0xFF && data[data.size() - 1] == 0xFF;
    }

    std::vector<uint8_t> InflateStream::feed(const std::vector<uint8_t>& input) {
        std::vector<uint8_t> result;
        streamEnded_ = false;
        if (input.empty()) return result;

        uint8_t out[ZlibBufferSize];

        stream.next_in  = const_cast<Bytef*>(input.data());
        stream.avail_in = static_cast<uInt>(input.size());

        while (true) {
            stream.avail_out = ZlibBufferSize;
            stream.next_out  = &out[0];

            int status = inflate(&stream, Z_SYNC_FLUSH);
            if (status != Z_OK && status != Z_STREAM_END && status != Z_BUF_ERROR) {
                std::string message = stream.msg ? stream.msg : zError(status);
                inflateReset(&stream);
                throw ZlibError(std::string("inflate failed: ") + message, status);
            }

            size_t have = ZlibBufferSize - stream.avail_out;
            result.insert(result.end(), out, out + have);

            if (status == Z_STREAM_END) {
                // Message was a complete stream, following data (if any) starts a new one.
                inflateReset(&stream);
                streamEnded_ = true;
                if (stream.avail_in == 0) break;
                continue;
            }

            // Z_BUF_ERROR: no progress possible, the rest will come in next frame.
            if (status == Z_BUF_ERROR) break;
            if (stream.avail_in == 0 && stream.avail_out != 0) break;
        }

        stream.next_in  = Z_NULL;
        stream.avail_in = 0;
        return result;
    }
}
}
