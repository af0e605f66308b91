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

#include <micro_ogg_stream/ogg_stream_writer.h>

namespace micro_ogg_stream {

OggStreamWriter::OggStreamWriter(OggByteSink& sink, uint32_t stream_id,
                                 const OggStreamWriterConfig& config)
    : sink_(sink),
      config_(config),
      current_page_(stream_id, OGG_PAGE_BEGIN_OF_STREAM, 0),
      stream_id_(stream_id) {
}

void OggStreamWriter::reset() {
    packet_index_ = 0;
    bytes_written_ = 0;
    granule_position_ = 0;
    end_of_stream_marked_ = false;
    finished_ = false;
    current_page_.clear();
    current_page_.type = OGG_PAGE_BEGIN_OF_STREAM;
    current_page_.packet_index = 0;
}

OggResult OggStreamWriter::write(const uint8_t* data, size_t len, size_t& bytes_written) {
    bytes_written = 0;
    if (!data) {
        return OGG_OK;
    }

    while (bytes_written < len) {
        // A full page left by a failed seal is retried before taking more bytes
        if (!current_page_.is_full()) {
            bytes_written += current_page_.write(data + bytes_written, len - bytes_written);
        }

        if (current_page_.is_full()) {
            OggResult result = auto_seal();
            if (result != OGG_OK) {
                return result;
            }
        }
    }
    return OGG_OK;
}

bool OggStreamWriter::write(const uint8_t* data, size_t len) {
    size_t bytes_written = 0;
    OggResult result = write(data, len, bytes_written);
    return result == OGG_OK && bytes_written == len;
}

OggResult OggStreamWriter::auto_seal() {
    uint64_t granule_position = granule_position_;
    if (strategy_) {
        granule_position = strategy_->compute_granule(current_page_.data.size());
    }
#ifdef MICRO_OGG_STREAM_DEBUG
    auto_seals_++;
#endif
    return seal_packet(granule_position, false);
}

OggResult OggStreamWriter::seal_packet(uint64_t granule_position, bool is_end_of_stream) {
    bool end_of_stream = is_end_of_stream || end_of_stream_marked_;

    // Header fields are stamped for serialization and put back if the page is not delivered
    const OggPageType previous_type = current_page_.type;
    const uint64_t previous_granule = current_page_.granule_position;
    const uint32_t previous_index = current_page_.packet_index;
    const uint32_t previous_checksum = current_page_.checksum;
    const bool was_empty = current_page_.segment_table.empty();

    current_page_.stream_id = stream_id_;
    current_page_.packet_index = packet_index_;
    current_page_.granule_position = granule_position;
    if (end_of_stream) {
        current_page_.type = OGG_PAGE_END_OF_STREAM;
    } else if (packet_index_ == 0) {
        current_page_.type = OGG_PAGE_BEGIN_OF_STREAM;
    } else {
        current_page_.type = OGG_PAGE_CONTINUATION;
    }

    // An empty payload still gets its terminating zero lacing value
    OggResult result = OGG_OK;
    if (was_empty) {
        result = ogg_lace(0, OGG_MAX_SEGMENTS, current_page_.segment_table);
    }
    if (result == OGG_OK) {
        result = current_page_.to_bytes(serialized_);
    }
    if (result == OGG_OK && !sink_.write(serialized_.data(), serialized_.size())) {
        result = OGG_SINK_FAILURE;
    }

    if (result != OGG_OK) {
        current_page_.type = previous_type;
        current_page_.granule_position = previous_granule;
        current_page_.packet_index = previous_index;
        current_page_.checksum = previous_checksum;
        if (was_empty) {
            current_page_.segment_table.clear();
        }
        return result;
    }

    // The page reached the sink; from here on it counts as sealed
    bytes_written_ += current_page_.data.size();
    packet_index_++;
    granule_position_ = granule_position;
    end_of_stream_marked_ = false;
    if (end_of_stream) {
        finished_ = true;
    }
    current_page_.clear();
#ifdef MICRO_OGG_STREAM_DEBUG
    pages_sealed_++;
#endif

    if (config_.flush_after_seal && !sink_.flush()) {
        return OGG_SINK_FAILURE;
    }
    return OGG_OK;
}

OggResult OggStreamWriter::finish() {
    if (finished_) {
        return OGG_OK;
    }
    return seal_packet(granule_position_, true);
}

bool OggStreamWriter::flush() {
    return sink_.flush();
}

}  // namespace micro_ogg_stream
