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

/* microOggStream - Ogg stream reader
 * Pulls bytes from an OggByteSource and yields validated pages one at a time.
 */

#ifndef MICRO_OGG_STREAM_OGG_STREAM_READER_H
#define MICRO_OGG_STREAM_OGG_STREAM_READER_H

#include <micro_ogg_stream/ogg_io.h>
#include <micro_ogg_stream/ogg_page.h>
#include <micro_ogg_stream/ogg_types.h>

#include <cstddef>
#include <cstdint>

namespace micro_ogg_stream {

/**
 * @brief Configuration for OggStreamReader
 *
 * Controls read sizes and the memory behavior of the internal arena.
 *
 * Custom Allocator Requirements:
 * - alloc: Must return nullptr on failure (like malloc)
 * - realloc: Must return nullptr on failure without freeing original ptr (like realloc)
 * - free: Must handle nullptr gracefully (like free)
 * - alloc, realloc and free must be provided together; otherwise all three are
 *   ignored and standard malloc/realloc/free are used
 */
struct OggStreamReaderConfig {
    size_t read_chunk_size = 2048;   // Minimum bytes requested from the source per read
    size_t min_buffer_size = 4096;   // Initial arena capacity
    size_t max_buffer_size = 69632;  // Arena limit, one maximum page + one chunk fits

    // Memory callbacks - nullptr means use malloc/free/realloc
    void* (*alloc)(size_t size) = nullptr;
    void* (*realloc)(void* ptr, size_t size) = nullptr;
    void (*free)(void* ptr) = nullptr;
};

/**
 * @brief Ogg page reader over a byte source
 *
 * Every well-formed page is returned in source order, whatever its stream id;
 * pages from interleaved logical streams are never filtered. stream_id() is
 * the id of the most recently returned page.
 *
 * States:
 * - Reading: normal operation
 * - End of stream seen: an EndOfStream page has been returned (is_eos()).
 *   Reading continues, other logical streams may still deliver pages.
 * - End of input: the source is exhausted (is_eof()). Buffered pages are still
 *   returned; after them get_packet() returns OGG_END_OF_INPUT.
 *
 * Any error is terminal: later calls return the same error until reset().
 *
 * Thread Safety:
 * - Each OggStreamReader instance must be used from a single thread only
 * - The reader owns its arena exclusively; it does not own the source
 *
 * Memory allocation:
 * - The arena is allocated on the first call to get_packet()
 * - It grows by doubling up to max_buffer_size and never shrinks
 * - Consumed bytes are compacted away before the next source read
 * - reset() keeps the allocation
 */
class OggStreamReader {
public:
    /**
     * @param source Byte source, must outlive the reader
     * @param config Configuration struct (uses defaults if not specified)
     */
    explicit OggStreamReader(OggByteSource& source,
                             const OggStreamReaderConfig& config = OggStreamReaderConfig{});
    ~OggStreamReader();

    // Prevent copying (would cause double-free of the arena)
    OggStreamReader(const OggStreamReader&) = delete;
    OggStreamReader& operator=(const OggStreamReader&) = delete;

    /**
     * @brief Read the next page
     *
     * Reads from the source until a whole page is buffered, then parses and
     * validates it.
     *
     * @param page Output: the page (only valid when OGG_OK is returned)
     * @return OGG_OK, OGG_END_OF_INPUT on a clean end, or an error:
     *         OGG_MALFORMED_HEADER, OGG_CHECKSUM_MISMATCH, OGG_TRUNCATED
     *         (residual bytes at end of input), OGG_SOURCE_FAILURE,
     *         OGG_CAPACITY_EXCEEDED, OGG_ALLOCATION_FAILED
     *
     * Usage:
     * @code
     * OggPage page;
     * OggResult result;
     * while ((result = reader.get_packet(page)) == OGG_OK) {
     *     // Use page.data, page.granule_position, ...
     * }
     * if (result != OGG_END_OF_INPUT) {
     *     // Handle error
     * }
     * @endcode
     */
    OggResult get_packet(OggPage& page);

    /**
     * @brief Drop buffered bytes and flags so the reader can continue on a
     *        repositioned or replaced source
     */
    void reset();

    // True once an EndOfStream page has been returned
    bool is_eos() const { return end_of_stream_; }

    // True once the source reported exhaustion
    bool is_eof() const { return end_of_input_; }

    // Stream id of the most recently returned page (0 before the first page)
    uint32_t stream_id() const { return stream_id_; }

    // Bytes read from the source but not yet returned as a page
    size_t buffered_bytes() const { return buffer_end_ - buffer_start_; }

#ifdef MICRO_OGG_STREAM_DEBUG
    /**
     * @brief Get read statistics
     * @param pages_read Output: number of pages returned
     * @param bytes_from_source Output: total bytes read from the source
     */
    void get_stats(size_t& pages_read, size_t& bytes_from_source) const {
        pages_read = pages_read_;
        bytes_from_source = bytes_from_source_;
    }

    /**
     * @brief Get buffer statistics
     * @param current_capacity Output: current arena capacity in bytes
     * @param peak_capacity Output: peak arena capacity reached in bytes
     */
    void get_buffer_stats(size_t& current_capacity, size_t& peak_capacity) const {
        current_capacity = buffer_capacity_;
        peak_capacity = peak_buffer_capacity_;
    }
#endif  // MICRO_OGG_STREAM_DEBUG

private:
    // Internal result codes for buffer growth operations
    enum GrowBufferResult : uint8_t {
        GROW_OK,                // Buffer is large enough or was grown successfully
        GROW_EXCEEDS_MAX,       // Requested size exceeds max_buffer_size
        GROW_ALLOCATION_FAILED  // Memory allocation failed
    };

    // Lazily allocate the arena on first use
    bool ensure_buffer_allocated();

    // Grow the arena to hold needed_size bytes
    GrowBufferResult grow_buffer(size_t needed_size);

    // Move unconsumed bytes to the front of the arena
    void compact_buffer();

    // One source read of a chunk, or of the shortfall when that is larger
    OggResult fill_buffer(size_t needed);

    // Remember and return an error; the reader stays in this state
    OggResult fail(OggResult result);

    OggByteSource& source_;
    OggStreamReaderConfig config_;

    uint8_t* buffer_{nullptr};  // Arena
    size_t buffer_capacity_{0};
    size_t buffer_start_{0};  // Consume cursor
    size_t buffer_end_{0};    // End of valid bytes

    uint32_t stream_id_{0};
    OggResult error_{OGG_OK};  // Sticky error
    bool end_of_stream_{false};
    bool end_of_input_{false};

#ifdef MICRO_OGG_STREAM_DEBUG
    size_t pages_read_{0};
    size_t bytes_from_source_{0};
    size_t peak_buffer_capacity_{0};
#endif
};

}  // namespace micro_ogg_stream

#endif  // MICRO_OGG_STREAM_OGG_STREAM_READER_H
