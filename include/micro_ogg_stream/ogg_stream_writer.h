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

/* microOggStream - Ogg stream writer
 * Accumulates caller bytes into pages and seals them into an OggByteSink.
 */

#ifndef MICRO_OGG_STREAM_OGG_STREAM_WRITER_H
#define MICRO_OGG_STREAM_OGG_STREAM_WRITER_H

#include <micro_ogg_stream/ogg_io.h>
#include <micro_ogg_stream/ogg_page.h>
#include <micro_ogg_stream/ogg_types.h>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <utility>
#include <vector>

namespace micro_ogg_stream {

/**
 * @brief Computes the granule position of pages sealed automatically
 *
 * Called by OggStreamWriter::write() when a page reaches capacity. The
 * returned value becomes the page's granule position and the writer's
 * current granule position.
 */
class OggGranuleStrategy {
public:
    virtual ~OggGranuleStrategy() = default;

    /**
     * @param bytes_about_to_seal Payload size of the page being sealed
     * @return Granule position for that page
     */
    virtual uint64_t compute_granule(size_t bytes_about_to_seal) = 0;
};

// Strategy backed by a callable, for stateful lambdas
class OggFunctionGranuleStrategy : public OggGranuleStrategy {
public:
    explicit OggFunctionGranuleStrategy(std::function<uint64_t(size_t)> function)
        : function_(std::move(function)) {}

    uint64_t compute_granule(size_t bytes_about_to_seal) override {
        return function_(bytes_about_to_seal);
    }

private:
    std::function<uint64_t(size_t)> function_;
};

/**
 * @brief Configuration for OggStreamWriter
 */
struct OggStreamWriterConfig {
    bool flush_after_seal = true;  // Call OggByteSink::flush() after every sealed page
};

/**
 * @brief Ogg page writer over a byte sink
 *
 * Page types are assigned at seal time: the first page sealed by the writer
 * is BeginOfStream, a page sealed with is_end_of_stream (or after
 * mark_cur_packet_as_end_of_stream()) is EndOfStream, all others are
 * Continuation. EndOfStream wins over BeginOfStream for a single-page stream.
 *
 * Every write() call becomes its own sub-segment of the current page. A page
 * that fills up (65025 payload bytes or 255 table entries) is sealed
 * automatically; if a write did not fit, its lacing ends in 255 and the data
 * continues on the next page.
 *
 * The writer is itself an OggByteSink, so it can feed any code that writes
 * to a sink, including another writer.
 *
 * The destructor does not seal the pending page; call finish().
 *
 * Thread Safety:
 * - Each OggStreamWriter instance must be used from a single thread only
 * - The writer does not own the sink
 */
class OggStreamWriter : public OggByteSink {
public:
    /**
     * @param sink Byte sink, must outlive the writer
     * @param stream_id Stream id stamped on every page
     * @param config Configuration struct (uses defaults if not specified)
     */
    OggStreamWriter(OggByteSink& sink, uint32_t stream_id,
                    const OggStreamWriterConfig& config = OggStreamWriterConfig{});

    OggStreamWriter(const OggStreamWriter&) = delete;
    OggStreamWriter& operator=(const OggStreamWriter&) = delete;

    /**
     * @brief Append bytes to the stream, sealing every page that fills up
     *
     * Granule position of an automatically sealed page: the strategy's result
     * if a strategy is set, otherwise the current granule position.
     *
     * @param data Bytes to write
     * @param len Number of bytes
     * @param bytes_written Output: bytes of data consumed; less than len only
     *                      when an automatic seal failed
     * @return OGG_OK or the error of a failed automatic seal (the full page is
     *         kept and the seal is retried by the next write() or seal_packet())
     */
    OggResult write(const uint8_t* data, size_t len, size_t& bytes_written);

    /**
     * @brief OggByteSink contract: accept all of data or fail
     * @return false if any automatic seal failed (bytes accepted before the
     *         failure stay in the stream)
     */
    bool write(const uint8_t* data, size_t len) override;

    /**
     * @brief Seal the current page, whatever its fill level, and send it to the sink
     *
     * @param granule_position Granule position of the sealed page; also becomes
     *                         the writer's current granule position
     * @param is_end_of_stream Seal as an EndOfStream page
     * @return OGG_OK, or OGG_SINK_FAILURE. When the sink's write() fails, the
     *         page (type, granule, lacing) and all counters are unchanged and
     *         the seal can be retried.
     *         When only the flush fails, the page counts as sealed.
     */
    OggResult seal_packet(uint64_t granule_position, bool is_end_of_stream);

    /**
     * @brief Seal the pending page as EndOfStream with the current granule position
     *
     * No-op once an EndOfStream page has been sealed.
     */
    OggResult finish();

    // The next seal (automatic or manual) produces an EndOfStream page
    void mark_cur_packet_as_end_of_stream() { end_of_stream_marked_ = true; }

    /**
     * @brief Start a fresh logical stream with the same stream id
     *
     * Clears packet index, bytes written, granule position, the current page
     * and the end-of-stream state. The next sealed page is BeginOfStream.
     */
    void reset();

    // Pass-through to the sink; does not seal the current page
    bool flush() override;

    void set_granule_position(uint64_t position) { granule_position_ = position; }
    uint64_t get_granule_position() const { return granule_position_; }

    // Payload bytes of all sealed pages
    uint64_t get_bytes_written() const { return bytes_written_; }

    // Sequence number the next sealed page will carry
    uint32_t get_packet_index() const { return packet_index_; }
    uint32_t get_stream_id() const { return stream_id_; }

    // True once an EndOfStream page has been sealed
    bool is_finished() const { return finished_; }

    const OggPage& current_packet() const { return current_page_; }

    void set_granule_strategy(std::unique_ptr<OggGranuleStrategy> strategy) {
        strategy_ = std::move(strategy);
    }

#ifdef MICRO_OGG_STREAM_DEBUG
    /**
     * @brief Get seal statistics
     * @param pages_sealed Output: pages written to the sink
     * @param auto_seals Output: pages sealed because they reached capacity
     */
    void get_stats(size_t& pages_sealed, size_t& auto_seals) const {
        pages_sealed = pages_sealed_;
        auto_seals = auto_seals_;
    }
#endif  // MICRO_OGG_STREAM_DEBUG

private:
    // Seal a page that reached capacity
    OggResult auto_seal();

    OggByteSink& sink_;
    OggStreamWriterConfig config_;
    std::unique_ptr<OggGranuleStrategy> strategy_;

    OggPage current_page_;
    std::vector<uint8_t> serialized_;  // Reused serialization buffer

    uint64_t granule_position_{0};
    uint64_t bytes_written_{0};
    uint32_t stream_id_;
    uint32_t packet_index_{0};
    bool end_of_stream_marked_{false};
    bool finished_{false};

#ifdef MICRO_OGG_STREAM_DEBUG
    size_t pages_sealed_{0};
    size_t auto_seals_{0};
#endif
};

}  // namespace micro_ogg_stream

#endif  // MICRO_OGG_STREAM_OGG_STREAM_WRITER_H
