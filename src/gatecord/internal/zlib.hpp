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

#ifndef GATECORD_ZLIB_HPP
#define GATECORD_ZLIB_HPP

#include <cstdint>
#include <vector>
#include <zlib.h>

namespace Gatecord {
    namespace Zlib {
        /**
         * \internal
         *
         * Long-lived zlib decompressor. Gateway compression context is shared
         * between all messages received over one connection, so same
         * InflateStream should be fed with all compressed frames in order they
         * were received and destroyed together with connection.
         *
         * Both transport compression (single endless stream, each message
         * ends with Z_SYNC_FLUSH) and payload compression (each message is a
         * complete zlib stream) are handled: stream is reset after Z_STREAM_END.
         */
        class InflateStream {
        public:
            InflateStream();
            ~InflateStream();

            InflateStream(const InflateStream&) = delete;
            InflateStream& operator=(const InflateStream&) = delete;

            /**
             * \internal
             *
             * Decompress next chunk of stream.
             *
             * \throws ZlibError if input is not valid zlib data. Stream
             *         is reset in this case.
             */
            std::vector<uint8_t> feed(const std::vector<uint8_t>& input);

            /**
             * \internal
             *
             * Forget stream state, next input should start a new zlib stream.
             */
            void reset();

            /**
             * \internal
             *
             * Whether last \ref feed call reached end of complete zlib stream.
             */
            inline bool streamEnded() const {
                return streamEnded_;
            }
        private:
            z_stream stream;
            bool streamEnded_ = false;
        };

        /**
         * \internal
         *
         * Whether data ends with Z_SYNC_FLUSH marker (00 00 FF FF), i.e. is
         * the last frame of message compressed using zlib-stream transport.
         */
        bool endsWithSyncFlush(const std::vector<uint8_t>& data);
    }
}

#endif // GATECORD_ZLIB_HPP
