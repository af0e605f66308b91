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

/* microOggStream - Ogg page framing, reading and writing
 * Shared constants, page types and result codes
 */

#ifndef MICRO_OGG_STREAM_OGG_TYPES_H
#define MICRO_OGG_STREAM_OGG_TYPES_H

#include <cstddef>
#include <cstdint>

namespace micro_ogg_stream {

// Ogg container constants (RFC 3533)
constexpr size_t OGG_PAGE_HEADER_SIZE = 27;       // Fixed header before segment table
constexpr size_t OGG_SEGMENT_COUNT_OFFSET = 26;   // Offset to segment_count field
constexpr size_t OGG_MAX_SEGMENTS = 255;          // Segment table entries per page
constexpr size_t OGG_MAX_HEADER_SIZE = 282;       // 27 + 255 segment table entries
constexpr size_t OGG_MAX_PAGE_BODY_SIZE = 65025;  // 255 segments x 255 bytes
constexpr size_t OGG_MAX_PAGE_SIZE = OGG_MAX_HEADER_SIZE + OGG_MAX_PAGE_BODY_SIZE;
constexpr uint8_t OGG_MAX_LACING_VALUE = 255;  // Lacing value indicating segment continues

// Ogg page header field offsets (RFC 3533)
constexpr size_t OGG_VERSION_OFFSET = 4;
constexpr size_t OGG_TYPE_OFFSET = 5;
constexpr size_t OGG_GRANULE_OFFSET = 6;
constexpr size_t OGG_SERIAL_OFFSET = 14;
constexpr size_t OGG_SEQUENCE_OFFSET = 18;
constexpr size_t OGG_CHECKSUM_OFFSET = 22;

/**
 * @brief Page type stored in the header type byte
 *
 * Exactly one value applies per page. Any other byte value on the wire is
 * rejected as a malformed header.
 */
enum OggPageType : uint8_t {
    OGG_PAGE_CONTINUATION = 0x00,     // Middle pages of a logical stream
    OGG_PAGE_BEGIN_OF_STREAM = 0x02,  // First page of a logical stream
    OGG_PAGE_END_OF_STREAM = 0x04     // Last page of a logical stream
};

/**
 * @brief Result codes shared by the page codec, reader and writer
 */
enum OggResult : int8_t {
    // Success codes
    OGG_OK = 0,            // Success
    OGG_END_OF_INPUT = 1,  // Source exhausted cleanly, no page produced

    // Framing errors
    OGG_MALFORMED_HEADER = -1,   // Bad capture pattern, version, type or table
    OGG_CHECKSUM_MISMATCH = -2,  // CRC checksum validation failed
    OGG_TRUNCATED = -3,          // Fewer bytes than the page needs
    OGG_CAPACITY_EXCEEDED = -4,  // Payload, segment table or buffer limit exceeded

    // Collaborator errors
    OGG_SINK_FAILURE = -5,    // Byte sink rejected a write or flush
    OGG_SOURCE_FAILURE = -6,  // Byte source reported a read error

    // Resource errors
    OGG_ALLOCATION_FAILED = -7  // Memory allocation failed
};

// Stable name for a result code ("OGG_OK", "OGG_TRUNCATED", ...)
const char* ogg_result_to_string(OggResult result);

inline bool ogg_is_error(OggResult result) {
    return result < 0;
}

}  // namespace micro_ogg_stream

#endif  // MICRO_OGG_STREAM_OGG_TYPES_H
