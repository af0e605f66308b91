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
 * See ogg_page.h for the wire layout and lacing rules.
 */

#include <micro_ogg_stream/ogg_page.h>

#include <algorithm>
#include <cstring>
#include <utility>

namespace micro_ogg_stream {

static const uint8_t OGG_CAPTURE_PATTERN[4] = {'O', 'g', 'g', 'S'};

// Little-endian helpers
static inline uint32_t read_le32(const uint8_t* p) {
    return static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8) |
           (static_cast<uint32_t>(p[2]) << 16) | (static_cast<uint32_t>(p[3]) << 24);
}

static inline uint64_t read_le64(const uint8_t* p) {
    return static_cast<uint64_t>(read_le32(p)) | (static_cast<uint64_t>(read_le32(p + 4)) << 32);
}

static inline void write_le32(uint32_t value, uint8_t* p) {
    p[0] = static_cast<uint8_t>(value & 0xff);
    p[1] = static_cast<uint8_t>((value >> 8) & 0xff);
    p[2] = static_cast<uint8_t>((value >> 16) & 0xff);
    p[3] = static_cast<uint8_t>((value >> 24) & 0xff);
}

static inline void write_le64(uint64_t value, uint8_t* p) {
    write_le32(static_cast<uint32_t>(value & 0xffffffffULL), p);
    write_le32(static_cast<uint32_t>(value >> 32), p + 4);
}

static inline bool is_valid_page_type(uint8_t type) {
    return type == OGG_PAGE_CONTINUATION || type == OGG_PAGE_BEGIN_OF_STREAM ||
           type == OGG_PAGE_END_OF_STREAM;
}

static size_t calculate_body_size(const uint8_t* segment_table, size_t segment_count) {
    size_t total = 0;
    for (size_t i = 0; i < segment_count; i++) {
        total += segment_table[i];
    }
    return total;
}

// CRC-32 lookup table (Ogg/Ethernet polynomial 0x04C11DB7)
static const uint32_t crc_lookup[256] = {
    0x00000000, 0x04c11db7, 0x09823b6e, 0x0d4326d9, 0x130476dc, 0x17c56b6b, 0x1a864db2, 0x1e475005,
    0x2608edb8, 0x22c9f00f, 0x2f8ad6d6, 0x2b4bcb61, 0x350c9b64, 0x31cd86d3, 0x3c8ea00a, 0x384fbdbd,
    0x4c11db70, 0x48d0c6c7, 0x4593e01e, 0x4152fda9, 0x5f15adac, 0x5bd4b01b, 0x569796c2, 0x52568b75,
    0x6a1936c8, 0x6ed82b7f, 0x639b0da6, 0x675a1011, 0x791d4014, 0x7ddc5da3, 0x709f7b7a, 0x745e66cd,
    0x9823b6e0, 0x9ce2ab57, 0x91a18d8e, 0x95609039, 0x8b27c03c, 0x8fe6dd8b, 0x82a5fb52, 0x8664e6e5,
    0xbe2b5b58, 0xbaea46ef, 0xb7a96036, 0xb3687d81, 0xad2f2d84, 0xa9ee3033, 0xa4ad16ea, 0xa06c0b5d,
    0xd4326d90, 0xd0f37027, 0xddb056fe, 0xd9714b49, 0xc7361b4c, 0xc3f706fb, 0xceb42022, 0xca753d95,
    0xf23a8028, 0xf6fb9d9f, 0xfbb8bb46, 0xff79a6f1, 0xe13ef6f4, 0xe5ffeb43, 0xe8bccd9a, 0xec7dd02d,
    0x34867077, 0x30476dc0, 0x3d044b19, 0x39c556ae, 0x278206ab, 0x23431b1c, 0x2e003dc5, 0x2ac12072,
    0x128e9dcf, 0x164f8078, 0x1b0ca6a1, 0x1fcdbb16, 0x018aeb13, 0x054bf6a4, 0x0808d07d, 0x0cc9cdca,
    0x7897ab07, 0x7c56b6b0, 0x71159069, 0x75d48dde, 0x6b93dddb, 0x6f52c06c, 0x6211e6b5, 0x66d0fb02,
    0x5e9f46bf, 0x5a5e5b08, 0x571d7dd1, 0x53dc6066, 0x4d9b3063, 0x495a2dd4, 0x44190b0d, 0x40d816ba,
    0xaca5c697, 0xa864db20, 0xa527fdf9, 0xa1e6e04e, 0xbfa1b04b, 0xbb60adfc, 0xb6238b25, 0xb2e29692,
    0x8aad2b2f, 0x8e6c3698, 0x832f1041, 0x87ee0df6, 0x99a95df3, 0x9d684044, 0x902b669d, 0x94ea7b2a,
    0xe0b41de7, 0xe4750050, 0xe9362689, 0xedf73b3e, 0xf3b06b3b, 0xf771768c, 0xfa325055, 0xfef34de2,
    0xc6bcf05f, 0xc27dede8, 0xcf3ecb31, 0xcbffd686, 0xd5b88683, 0xd1799b34, 0xdc3abded, 0xd8fba05a,
    0x690ce0ee, 0x6dcdfd59, 0x608edb80, 0x644fc637, 0x7a089632, 0x7ec98b85, 0x738aad5c, 0x774bb0eb,
    0x4f040d56, 0x4bc510e1, 0x46863638, 0x42472b8f, 0x5c007b8a, 0x58c1663d, 0x558240e4, 0x51435d53,
    0x251d3b9e, 0x21dc2629, 0x2c9f00f0, 0x285e1d47, 0x36194d42, 0x32d850f5, 0x3f9b762c, 0x3b5a6b9b,
    0x0315d626, 0x07d4cb91, 0x0a97ed48, 0x0e56f0ff, 0x1011a0fa, 0x14d0bd4d, 0x19939b94, 0x1d528623,
    0xf12f560e, 0xf5ee4bb9, 0xf8ad6d60, 0xfc6c70d7, 0xe22b20d2, 0xe6ea3d65, 0xeba91bbc, 0xef68060b,
    0xd727bbb6, 0xd3e6a601, 0xdea580d8, 0xda649d6f, 0xc423cd6a, 0xc0e2d0dd, 0xcda1f604, 0xc960ebb3,
    0xbd3e8d7e, 0xb9ff90c9, 0xb4bcb610, 0xb07daba7, 0xae3afba2, 0xaafbe615, 0xa7b8c0cc, 0xa379dd7b,
    0x9b3660c6, 0x9ff77d71, 0x92b45ba8, 0x9675461f, 0x8832161a, 0x8cf30bad, 0x81b02d74, 0x857130c3,
    0x5d8a9099, 0x594b8d2e, 0x5408abf7, 0x50c9b640, 0x4e8ee645, 0x4a4ffbf2, 0x470cdd2b, 0x43cdc09c,
    0x7b827d21, 0x7f436096, 0x7200464f, 0x76c15bf8, 0x68860bfd, 0x6c47164a, 0x61043093, 0x65c52d24,
    0x119b4be9, 0x155a565e, 0x18197087, 0x1cd86d30, 0x029f3d35, 0x065e2082, 0x0b1d065b, 0x0fdc1bec,
    0x3793a651, 0x3352bbe6, 0x3e119d3f, 0x3ad08088, 0x2497d08d, 0x2056cd3a, 0x2d15ebe3, 0x29d4f654,
    0xc5a92679, 0xc1683bce, 0xcc2b1d17, 0xc8ea00a0, 0xd6ad50a5, 0xd26c4d12, 0xdf2f6bcb, 0xdbee767c,
    0xe3a1cbc1, 0xe760d676, 0xea23f0af, 0xeee2ed18, 0xf0a5bd1d, 0xf464a0aa, 0xf9278673, 0xfde69bc4,
    0x89b8fd09, 0x8d79e0be, 0x803ac667, 0x84fbdbd0, 0x9abc8bd5, 0x9e7d9662, 0x933eb0bb, 0x97ffad0c,
    0xafb010b1, 0xab710d06, 0xa6322bdf, 0xa2f33668, 0xbcb4666d, 0xb8757bda, 0xb5365d03, 0xb1f740b4};

// ==============================================================================
// CHECKSUM AND LENGTH DISCOVERY
// ==============================================================================

uint32_t ogg_crc32(const uint8_t* buffer, size_t size, uint32_t crc) {
    // Four table steps per 32-bit word, eight bytes per iteration
    while (size >= 8) {
        crc ^= (static_cast<uint32_t>(buffer[0]) << 24) | (static_cast<uint32_t>(buffer[1]) << 16) |
               (static_cast<uint32_t>(buffer[2]) << 8) | buffer[3];
        crc = crc_lookup[(crc >> 24) & 0xff] ^ (crc << 8);
        crc = crc_lookup[(crc >> 24) & 0xff] ^ (crc << 8);
        crc = crc_lookup[(crc >> 24) & 0xff] ^ (crc << 8);
        crc = crc_lookup[(crc >> 24) & 0xff] ^ (crc << 8);

        crc ^= (static_cast<uint32_t>(buffer[4]) << 24) | (static_cast<uint32_t>(buffer[5]) << 16) |
               (static_cast<uint32_t>(buffer[6]) << 8) | buffer[7];
        crc = crc_lookup[(crc >> 24) & 0xff] ^ (crc << 8);
        crc = crc_lookup[(crc >> 24) & 0xff] ^ (crc << 8);
        crc = crc_lookup[(crc >> 24) & 0xff] ^ (crc << 8);
        crc = crc_lookup[(crc >> 24) & 0xff] ^ (crc << 8);

        buffer += 8;
        size -= 8;
    }

    while (size != 0) {
        crc = (crc << 8) ^ crc_lookup[((crc >> 24) & 0xff) ^ *buffer++];
        --size;
    }

    return crc;
}

OggResult ogg_get_checksum(const uint8_t* page, size_t page_len, uint32_t& checksum) {
    if (page_len < OGG_PAGE_HEADER_SIZE) {
        return OGG_TRUNCATED;
    }

    static const uint8_t zero_field[4] = {0, 0, 0, 0};
    uint32_t crc = ogg_crc32(page, OGG_CHECKSUM_OFFSET, 0);
    crc = ogg_crc32(zero_field, sizeof(zero_field), crc);
    crc = ogg_crc32(page + OGG_CHECKSUM_OFFSET + 4, page_len - OGG_CHECKSUM_OFFSET - 4, crc);

    checksum = crc;
    return OGG_OK;
}

OggResult ogg_fill_checksum_field(uint8_t* page, size_t page_len) {
    uint32_t checksum = 0;
    OggResult result = ogg_get_checksum(page, page_len, checksum);
    if (result != OGG_OK) {
        return result;
    }
    write_le32(checksum, page + OGG_CHECKSUM_OFFSET);
    return OGG_OK;
}

OggResult ogg_get_length(const uint8_t* data, size_t data_len, size_t& page_length) {
    if (data_len < OGG_PAGE_HEADER_SIZE) {
        page_length = OGG_PAGE_HEADER_SIZE;
        return OGG_TRUNCATED;
    }

    if (std::memcmp(data, OGG_CAPTURE_PATTERN, sizeof(OGG_CAPTURE_PATTERN)) != 0) {
        return OGG_MALFORMED_HEADER;
    }
    if (data[OGG_VERSION_OFFSET] != 0x00) {
        return OGG_MALFORMED_HEADER;
    }
    if (!is_valid_page_type(data[OGG_TYPE_OFFSET])) {
        return OGG_MALFORMED_HEADER;
    }

    // Total header size = 27 + segment_count
    size_t segment_count = data[OGG_SEGMENT_COUNT_OFFSET];
    size_t header_size = OGG_PAGE_HEADER_SIZE + segment_count;
    if (data_len < header_size) {
        page_length = header_size;
        return OGG_TRUNCATED;
    }

    page_length = header_size + calculate_body_size(data + OGG_PAGE_HEADER_SIZE, segment_count);
    return OGG_OK;
}

// ==============================================================================
// LACING
// ==============================================================================

OggResult ogg_lace(size_t length, size_t max_entries, std::vector<uint8_t>& table) {
    size_t full_entries = length / OGG_MAX_LACING_VALUE;
    size_t remainder = length % OGG_MAX_LACING_VALUE;

    if (full_entries > max_entries || (full_entries == max_entries && remainder != 0)) {
        return OGG_CAPACITY_EXCEEDED;
    }

    table.insert(table.end(), full_entries, OGG_MAX_LACING_VALUE);

    // A run that fills every available entry stays open (continued packet)
    if (full_entries < max_entries) {
        table.push_back(static_cast<uint8_t>(remainder));
    }
    return OGG_OK;
}

// ==============================================================================
// OggPage
// ==============================================================================

OggPage::OggPage(uint32_t stream_id, OggPageType type, uint32_t packet_index)
    : type(type), stream_id(stream_id), packet_index(packet_index) {
}

size_t OggPage::open_run_start() const {
    size_t index = segment_table.size();
    while (index > 0 && segment_table[index - 1] == OGG_MAX_LACING_VALUE) {
        index--;
    }
    return index;
}

size_t OggPage::write(const uint8_t* bytes, size_t len) {
    if (len == 0 || bytes == nullptr || is_full()) {
        return 0;
    }

    // A terminated table gets a new sub-segment; an open run of 255s is continued
    size_t run_start = open_run_start();
    size_t run_size = (segment_table.size() - run_start) * OGG_MAX_LACING_VALUE;
    size_t run_entries = OGG_MAX_SEGMENTS - run_start;
    size_t run_limit = run_entries * OGG_MAX_LACING_VALUE;

    size_t accepted = std::min(len, OGG_MAX_PAGE_BODY_SIZE - data.size());
    accepted = std::min(accepted, run_limit - run_size);
    if (accepted == 0) {
        return 0;
    }

    // ogg_lace appends nothing on failure; the open run is dropped only on success
    size_t previous_size = segment_table.size();
    if (ogg_lace(run_size + accepted, run_entries, segment_table) != OGG_OK) {
        return 0;
    }
    segment_table.erase(segment_table.begin() + static_cast<std::ptrdiff_t>(run_start),
                        segment_table.begin() + static_cast<std::ptrdiff_t>(previous_size));

    data.insert(data.end(), bytes, bytes + accepted);
    return accepted;
}

bool OggPage::is_full() const {
    return data.size() >= OGG_MAX_PAGE_BODY_SIZE || segment_table.size() >= OGG_MAX_SEGMENTS;
}

void OggPage::clear() {
    segment_table.clear();
    data.clear();
}

std::vector<std::vector<uint8_t>> OggPage::get_segments() const {
    std::vector<std::vector<uint8_t>> segments;
    std::vector<uint8_t> current;
    size_t position = 0;
    bool open = false;

    for (size_t i = 0; i < segment_table.size(); i++) {
        uint8_t lacing = segment_table[i];
        size_t end = std::min(position + lacing, data.size());
        current.insert(current.end(), data.data() + position, data.data() + end);
        position = end;

        if (lacing < OGG_MAX_LACING_VALUE) {
            segments.push_back(std::move(current));
            current.clear();
            open = false;
        } else {
            open = true;
        }
    }

    if (open) {
        segments.push_back(std::move(current));
    }
    return segments;
}

size_t OggPage::get_inner_data_size() const {
    return calculate_body_size(segment_table.data(), segment_table.size());
}

std::vector<uint8_t> OggPage::get_inner_data() const {
    size_t size = std::min(get_inner_data_size(), data.size());
    return std::vector<uint8_t>(data.begin(), data.begin() + static_cast<std::ptrdiff_t>(size));
}

size_t OggPage::get_serialized_size() const {
    return OGG_PAGE_HEADER_SIZE + segment_table.size() + data.size();
}

bool OggPage::is_last_segment_continued() const {
    return !segment_table.empty() && segment_table.back() == OGG_MAX_LACING_VALUE;
}

OggResult OggPage::check_capacity() const {
    if (version != 0x00 || !is_valid_page_type(type)) {
        return OGG_MALFORMED_HEADER;
    }
    if (segment_table.size() > OGG_MAX_SEGMENTS || data.size() > OGG_MAX_PAGE_BODY_SIZE) {
        return OGG_CAPACITY_EXCEEDED;
    }
    if (get_inner_data_size() != data.size()) {
        return OGG_MALFORMED_HEADER;
    }
    return OGG_OK;
}

void OggPage::write_header(uint8_t* out) const {
    std::memcpy(out, OGG_CAPTURE_PATTERN, sizeof(OGG_CAPTURE_PATTERN));
    out[OGG_VERSION_OFFSET] = version;
    out[OGG_TYPE_OFFSET] = static_cast<uint8_t>(type);
    write_le64(granule_position, out + OGG_GRANULE_OFFSET);
    write_le32(stream_id, out + OGG_SERIAL_OFFSET);
    write_le32(packet_index, out + OGG_SEQUENCE_OFFSET);
    write_le32(0, out + OGG_CHECKSUM_OFFSET);
    out[OGG_SEGMENT_COUNT_OFFSET] = static_cast<uint8_t>(segment_table.size());
    if (!segment_table.empty()) {
        std::memcpy(out + OGG_PAGE_HEADER_SIZE, segment_table.data(), segment_table.size());
    }
}

// ==============================================================================
// SERIALIZATION
// ==============================================================================

OggResult OggPage::to_bytes(std::vector<uint8_t>& out) {
    OggResult result = check_capacity();
    if (result != OGG_OK) {
        return result;
    }

    size_t header_size = OGG_PAGE_HEADER_SIZE + segment_table.size();
    out.resize(header_size + data.size());
    write_header(out.data());
    if (!data.empty()) {
        std::memcpy(out.data() + header_size, data.data(), data.size());
    }

    result = ogg_fill_checksum_field(out.data(), out.size());
    if (result != OGG_OK) {
        return result;
    }
    checksum = read_le32(out.data() + OGG_CHECKSUM_OFFSET);
    return OGG_OK;
}

OggResult OggPage::into_bytes(std::vector<uint8_t>& out) {
    OggResult result = check_capacity();
    if (result != OGG_OK) {
        return result;
    }

    // Reuse the payload allocation for the serialized page
    size_t header_size = OGG_PAGE_HEADER_SIZE + segment_table.size();
    std::vector<uint8_t> bytes(std::move(data));
    bytes.insert(bytes.begin(), header_size, 0);
    write_header(bytes.data());

    result = ogg_fill_checksum_field(bytes.data(), bytes.size());
    if (result != OGG_OK) {
        return result;
    }
    checksum = read_le32(bytes.data() + OGG_CHECKSUM_OFFSET);

    out = std::move(bytes);
    clear();
    return OGG_OK;
}

// ==============================================================================
// DESERIALIZATION
// ==============================================================================

OggResult OggPage::from_bytes(const uint8_t* data, size_t data_len, OggPage& page,
                              size_t& page_length) {
    if (data_len > 0 && data == nullptr) {
        return OGG_MALFORMED_HEADER;
    }

    size_t length = 0;
    OggResult result = ogg_get_length(data, data_len, length);
    if (result == OGG_TRUNCATED) {
        page_length = length;
        return result;
    }
    if (result != OGG_OK) {
        return result;
    }

    page_length = length;
    if (data_len < length) {
        return OGG_TRUNCATED;
    }

    uint32_t computed = 0;
    result = ogg_get_checksum(data, length, computed);
    if (result != OGG_OK) {
        return result;
    }
    uint32_t stored = read_le32(data + OGG_CHECKSUM_OFFSET);
    if (computed != stored) {
        return OGG_CHECKSUM_MISMATCH;
    }

    size_t segment_count = data[OGG_SEGMENT_COUNT_OFFSET];
    const uint8_t* table = data + OGG_PAGE_HEADER_SIZE;
    const uint8_t* body = table + segment_count;

    page.version = data[OGG_VERSION_OFFSET];
    page.type = static_cast<OggPageType>(data[OGG_TYPE_OFFSET]);
    page.granule_position = read_le64(data + OGG_GRANULE_OFFSET);
    page.stream_id = read_le32(data + OGG_SERIAL_OFFSET);
    page.packet_index = read_le32(data + OGG_SEQUENCE_OFFSET);
    page.checksum = stored;
    page.segment_table.assign(table, table + segment_count);
    page.data.assign(body, data + length);

    return OGG_OK;
}

OggResult OggPage::from_cursor(const uint8_t* data, size_t data_len, size_t& position,
                               std::vector<OggPage>& pages) {
    while (position < data_len) {
        OggPage page;
        size_t page_length = 0;
        OggResult result = from_bytes(data + position, data_len - position, page, page_length);
        if (result != OGG_OK) {
            return result;
        }
        pages.push_back(std::move(page));
        position += page_length;
    }
    return OGG_OK;
}

bool OggPage::operator==(const OggPage& other) const {
    return version == other.version && type == other.type &&
           granule_position == other.granule_position && stream_id == other.stream_id &&
           packet_index == other.packet_index && checksum == other.checksum &&
           segment_table == other.segment_table && data == other.data;
}

}  // namespace micro_ogg_stream
