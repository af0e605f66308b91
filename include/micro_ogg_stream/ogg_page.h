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

/* microOggStream - Ogg page codec
 * Serializes and parses single RFC 3533 pages, builds and walks lacing tables,
 * computes and validates page checksums.
 *
 * No I/O; see ogg_stream_reader.h and ogg_stream_writer.h for streaming.
 */

#ifndef MICRO_OGG_STREAM_OGG_PAGE_H
#define MICRO_OGG_STREAM_OGG_PAGE_H

#include <micro_ogg_stream/ogg_types.h>

#include <cstddef>
#include <cstdint>
#include <vector>

namespace micro_ogg_stream {

/**
 * @brief Update an Ogg CRC-32 (polynomial 0x04C11DB7, unreflected) over a buffer
 *
 * @param buffer Bytes to process
 * @param size Number of bytes
 * @param crc Running CRC value, 0 to start a new computation
 * @return Updated CRC value
 */
uint32_t ogg_crc32(const uint8_t* buffer, size_t size, uint32_t crc = 0);

/**
 * @brief Compute the checksum of a serialized page
 *
 * The 4-byte checksum field is treated as zero during the computation, so the
 * result can be compared directly with the stored field.
 *
 * @param page Serialized page bytes (exactly one page)
 * @param page_len Length of the serialized page
 * @param checksum Output: computed checksum
 * @return OGG_OK, or OGG_TRUNCATED if page_len is shorter than the fixed header
 */
OggResult ogg_get_checksum(const uint8_t* page, size_t page_len, uint32_t& checksum);

/**
 * @brief Compute the checksum of a serialized page and store it in place
 * @return OGG_OK, or OGG_TRUNCATED if page_len is shorter than the fixed header
 */
OggResult ogg_fill_checksum_field(uint8_t* page, size_t page_len);

/**
 * @brief Discover the total length of the page starting at data
 *
 * Only the fixed header and the segment table need to be present; the
 * payload is not touched. This lets a streaming reader know how many bytes to
 * pull before attempting to parse.
 *
 * @param data Buffered bytes, starting at a page boundary
 * @param data_len Number of buffered bytes
 * @param page_length Output: total page length on OGG_OK. On OGG_TRUNCATED, the
 *                    number of bytes needed before discovery can progress
 *                    (27, then 27 + segment_count).
 * @return OGG_OK, OGG_TRUNCATED or OGG_MALFORMED_HEADER
 */
OggResult ogg_get_length(const uint8_t* data, size_t data_len, size_t& page_length);

/**
 * @brief Append lacing values for one sub-segment of the given length
 *
 * Emits floor(length / 255) entries of 255 followed by a terminating entry of
 * length % 255, which is present even when it is zero. When the terminator
 * would not fit in max_entries, the run of 255s is left open, marking the
 * sub-segment as continued on the next page.
 *
 * @param length Sub-segment length in bytes
 * @param max_entries Table entries available for this sub-segment
 * @param table Segment table to append to
 * @return OGG_OK, or OGG_CAPACITY_EXCEEDED if length does not fit in max_entries
 */
OggResult ogg_lace(size_t length, size_t max_entries, std::vector<uint8_t>& table);

/**
 * @brief One Ogg page
 *
 * The public streaming API calls this unit a "packet" (get_packet(),
 * seal_packet()). It is the physical framing unit; a page may carry several
 * lacing-delimited sub-segments, and a logical packet may span several pages.
 * Joining continued sub-segments across pages is left to the caller.
 *
 * Invariants for a serializable page:
 * - version == 0
 * - segment_table.size() <= 255
 * - sum(segment_table) == data.size()
 */
struct OggPage {
    uint8_t version{0};                           // Stream structure version (0x00)
    OggPageType type{OGG_PAGE_BEGIN_OF_STREAM};  // Continuation, BOS or EOS
    uint64_t granule_position{0};                 // Caller-defined position
    uint32_t stream_id{0};                        // Logical bitstream serial number
    uint32_t packet_index{0};                     // Page sequence number
    uint32_t checksum{0};                         // Filled by to_bytes(), checked by from_bytes()
    std::vector<uint8_t> segment_table;           // Lacing values
    std::vector<uint8_t> data;                    // Payload

    OggPage() = default;
    OggPage(uint32_t stream_id, OggPageType type, uint32_t packet_index);

    /**
     * @brief Append payload bytes, bounded by page capacity
     *
     * Each call is laced as its own terminated sub-segment, so get_segments()
     * recovers the write boundaries. If the table ends in an open run of 255s
     * (a sub-segment continued from a previous call that ran out of room), the
     * new bytes continue that run instead. Acceptance is bounded by the
     * payload capacity and by the table entries left; when the terminator
     * does not fit the run is left open. Never fails: callers must check the
     * return value and submit the remainder to a new page.
     *
     * @return Number of bytes actually appended
     */
    size_t write(const uint8_t* bytes, size_t len);

    // No further byte can be written: 65025 payload bytes or 255 table entries
    bool is_full() const;

    /**
     * @brief Drop payload and segment table, keeping allocated capacity
     */
    void clear();

    /**
     * @brief Split the payload into the sub-segments described by the lacing table
     *
     * A trailing run of 255 entries without a terminator is returned as the
     * last sub-segment; see is_last_segment_continued().
     */
    std::vector<std::vector<uint8_t>> get_segments() const;

    // Sum of the lacing values
    size_t get_inner_data_size() const;

    // Payload flattened through the lacing table
    std::vector<uint8_t> get_inner_data() const;

    // 27 + segment table + payload
    size_t get_serialized_size() const;

    // True when the last lacing value is 255 (sub-segment continues on the next page)
    bool is_last_segment_continued() const;

    bool is_begin_of_stream() const { return type == OGG_PAGE_BEGIN_OF_STREAM; }
    bool is_end_of_stream() const { return type == OGG_PAGE_END_OF_STREAM; }

    /**
     * @brief Serialize the page and fill its checksum
     *
     * The computed checksum is also stored in this->checksum.
     *
     * @param out Replaced with the serialized page
     * @return OGG_OK, OGG_MALFORMED_HEADER (version or table/payload mismatch) or
     *         OGG_CAPACITY_EXCEEDED (table or payload beyond framing limits)
     */
    OggResult to_bytes(std::vector<uint8_t>& out);

    /**
     * @brief Serialize the page, handing its payload storage to out
     *
     * On OGG_OK the page is left empty (as after clear()). On error the page
     * is unchanged.
     */
    OggResult into_bytes(std::vector<uint8_t>& out);

    /**
     * @brief Parse and validate one page at the start of data
     *
     * @param data Input bytes
     * @param data_len Available input bytes
     * @param page Output: parsed page (only valid on OGG_OK)
     * @param page_length Output: bytes the page occupies (also on
     *                    OGG_CHECKSUM_MISMATCH). On OGG_TRUNCATED, the bytes
     *                    needed before parsing can progress, as ogg_get_length().
     * @return OGG_OK, OGG_TRUNCATED, OGG_MALFORMED_HEADER or OGG_CHECKSUM_MISMATCH
     */
    static OggResult from_bytes(const uint8_t* data, size_t data_len, OggPage& page,
                                size_t& page_length);

    /**
     * @brief Parse consecutive pages from position until the buffer is consumed
     *
     * Every successfully parsed page is appended to pages and position is
     * advanced past it. Reaching the end of the buffer on a page boundary is a
     * clean stop (OGG_OK). A malformed, corrupt or truncated trailing page
     * returns its error with position left after the last good page.
     */
    static OggResult from_cursor(const uint8_t* data, size_t data_len, size_t& position,
                                 std::vector<OggPage>& pages);

    bool operator==(const OggPage& other) const;
    bool operator!=(const OggPage& other) const { return !(*this == other); }

private:
    // Index of the trailing run of 255 entries, or table size if the table is terminated
    size_t open_run_start() const;

    OggResult check_capacity() const;
    void write_header(uint8_t* out) const;
};

}  // namespace micro_ogg_stream

#endif  // MICRO_OGG_STREAM_OGG_PAGE_H
