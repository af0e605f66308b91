// Copyright 2025 Kevin Ahrendt
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

/* microOggStream - byte source and sink contracts
 * The reader and writer only talk to these interfaces. Memory and stdio
 * adapters are provided for the common cases.
 */

#ifndef MICRO_OGG_STREAM_OGG_IO_H
#define MICRO_OGG_STREAM_OGG_IO_H

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <vector>

namespace micro_ogg_stream {

/**
 * @brief Produces bytes on demand
 *
 * Implementations may return fewer bytes than requested. Returning true with
 * bytes_read == 0 signals that the source is exhausted.
 */
class OggByteSource {
public:
    virtual ~OggByteSource() = default;

    /**
     * @param buffer Destination for the bytes
     * @param capacity Maximum number of bytes to read
     * @param bytes_read Output: number of bytes stored in buffer
     * @return false on a read error
     */
    virtual bool read(uint8_t* buffer, size_t capacity, size_t& bytes_read) = 0;
};

/**
 * @brief Accepts bytes
 *
 * write() must accept the whole buffer or fail.
 */
class OggByteSink {
public:
    virtual ~OggByteSink() = default;

    virtual bool write(const uint8_t* data, size_t len) = 0;
    virtual bool flush() { return true; }
};

/**
 * @brief Source over a caller-owned memory buffer
 *
 * max_chunk limits how many bytes a single read() returns, which simulates
 * fragmented delivery (0 means unlimited).
 */
class OggMemorySource : public OggByteSource {
public:
    OggMemorySource(const uint8_t* data, size_t len, size_t max_chunk = 0);

    bool read(uint8_t* buffer, size_t capacity, size_t& bytes_read) override;

    size_t position() const { return position_; }
    size_t remaining() const { return len_ - position_; }

private:
    const uint8_t* data_;
    size_t len_;
    size_t position_{0};
    size_t max_chunk_;
};

// Sink appending to an owned byte vector
class OggVectorSink : public OggByteSink {
public:
    bool write(const uint8_t* data, size_t len) override;

    const std::vector<uint8_t>& bytes() const { return bytes_; }
    std::vector<uint8_t>& bytes() { return bytes_; }
    void clear() { bytes_.clear(); }

private:
    std::vector<uint8_t> bytes_;
};

// Source reading from a caller-owned stdio stream (not closed)
class OggFileSource : public OggByteSource {
public:
    explicit OggFileSource(FILE* file) : file_(file) {}

    bool read(uint8_t* buffer, size_t capacity, size_t& bytes_read) override;

private:
    FILE* file_;
};

// Sink writing to a caller-owned stdio stream (not closed)
class OggFileSink : public OggByteSink {
public:
    explicit OggFileSink(FILE* file) : file_(file) {}

    bool write(const uint8_t* data, size_t len) override;
    bool flush() override;

private:
    FILE* file_;
};

}  // namespace micro_ogg_stream

#endif  // MICRO_OGG_STREAM_OGG_IO_H
