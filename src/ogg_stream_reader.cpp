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
 * See ogg_stream_reader.h for the state model.
 */

#include <micro_ogg_stream/ogg_stream_reader.h>

#include <algorithm>
#include <cstdlib>
#include <cstring>

namespace micro_ogg_stream {

OggStreamReader::OggStreamReader(OggByteSource& source, const OggStreamReaderConfig& config)
    : source_(source), config_(config) {
    // Validate and fix buffer size configuration
    if (config_.read_chunk_size == 0) {
        config_.read_chunk_size = 2048;
    }
    if (config_.min_buffer_size == 0) {
        config_.min_buffer_size = 4096;
    }
    if (config_.max_buffer_size < config_.min_buffer_size) {
        config_.max_buffer_size = config_.min_buffer_size;
    }

    // If only some callbacks are provided, fall back to all standard functions
    bool has_alloc = (config_.alloc != nullptr);
    bool has_realloc = (config_.realloc != nullptr);
    bool has_free = (config_.free != nullptr);
    if (has_alloc != has_free || has_alloc != has_realloc) {
        config_.alloc = nullptr;
        config_.realloc = nullptr;
        config_.free = nullptr;
    }
}

OggStreamReader::~OggStreamReader() {
    if (buffer_) {
        if (config_.free) {
            config_.free(buffer_);
        } else {
            std::free(buffer_);
        }
    }
}

// ==============================================================================
// PUBLIC API
// ==============================================================================

void OggStreamReader::reset() {
    buffer_start_ = 0;
    buffer_end_ = 0;
    stream_id_ = 0;
    error_ = OGG_OK;
    end_of_stream_ = false;
    end_of_input_ = false;
#ifdef MICRO_OGG_STREAM_DEBUG
    pages_read_ = 0;
    bytes_from_source_ = 0;
#endif
}

OggResult OggStreamReader::get_packet(OggPage& page) {
    if (error_ != OGG_OK) {
        return error_;
    }

    if (!ensure_buffer_allocated()) {
        return fail(OGG_ALLOCATION_FAILED);
    }

    while (true) {
        const uint8_t* start = buffer_ + buffer_start_;
        size_t available = buffer_end_ - buffer_start_;

        // Discover the page length from the header and segment table alone
        size_t page_length = 0;
        OggResult result = ogg_get_length(start, available, page_length);
        if (result != OGG_OK && result != OGG_TRUNCATED) {
            return fail(result);
        }

        if (result == OGG_OK && available >= page_length) {
            size_t consumed = 0;
            result = OggPage::from_bytes(start, available, page, consumed);
            if (result != OGG_OK) {
                return fail(result);
            }

            buffer_start_ += consumed;
            if (buffer_start_ == buffer_end_) {
                buffer_start_ = 0;
                buffer_end_ = 0;
            }

            stream_id_ = page.stream_id;
            if (page.type == OGG_PAGE_END_OF_STREAM) {
                end_of_stream_ = true;
            }
#ifdef MICRO_OGG_STREAM_DEBUG
            pages_read_++;
#endif
            return OGG_OK;
        }

        // page_length is either the whole page or what is needed to read the table
        if (end_of_input_) {
            if (available == 0) {
                return OGG_END_OF_INPUT;
            }
            return fail(OGG_TRUNCATED);
        }

        result = fill_buffer(page_length - available);
        if (result != OGG_OK) {
            return fail(result);
        }
    }
}

// ==============================================================================
// PRIVATE HELPERS: Arena Management
// ==============================================================================

OggResult OggStreamReader::fail(OggResult result) {
    error_ = result;
    return result;
}

bool OggStreamReader::ensure_buffer_allocated() {
    if (buffer_) {
        return true;
    }

    void* ptr = config_.alloc ? config_.alloc(config_.min_buffer_size)
                              : std::malloc(config_.min_buffer_size);
    if (!ptr) {
        return false;
    }
    buffer_ = static_cast<uint8_t*>(ptr);
    buffer_capacity_ = config_.min_buffer_size;
#ifdef MICRO_OGG_STREAM_DEBUG
    peak_buffer_capacity_ = buffer_capacity_;
#endif
    return true;
}

void OggStreamReader::compact_buffer() {
    if (buffer_start_ == 0) {
        return;
    }
    size_t available = buffer_end_ - buffer_start_;
    if (available > 0) {
        std::memmove(buffer_, buffer_ + buffer_start_, available);
    }
    buffer_start_ = 0;
    buffer_end_ = available;
}

OggResult OggStreamReader::fill_buffer(size_t needed) {
    compact_buffer();

    // Read a whole chunk when it fits, otherwise only the shortfall
    size_t to_read = std::max(needed, config_.read_chunk_size);
    if (buffer_end_ + to_read > config_.max_buffer_size) {
        if (buffer_end_ + needed > config_.max_buffer_size) {
            return OGG_CAPACITY_EXCEEDED;
        }
        to_read = config_.max_buffer_size - buffer_end_;
    }

    GrowBufferResult grow_result = grow_buffer(buffer_end_ + to_read);
    if (grow_result == GROW_EXCEEDS_MAX) {
        return OGG_CAPACITY_EXCEEDED;
    }
    if (grow_result == GROW_ALLOCATION_FAILED) {
        return OGG_ALLOCATION_FAILED;
    }

    size_t bytes_read = 0;
    if (!source_.read(buffer_ + buffer_end_, to_read, bytes_read)) {
        return OGG_SOURCE_FAILURE;
    }
    bytes_read = std::min(bytes_read, to_read);

    if (bytes_read == 0) {
        end_of_input_ = true;
        return OGG_OK;
    }

    buffer_end_ += bytes_read;
#ifdef MICRO_OGG_STREAM_DEBUG
    bytes_from_source_ += bytes_read;
#endif
    return OGG_OK;
}

OggStreamReader::GrowBufferResult OggStreamReader::grow_buffer(size_t needed_size) {
    // Check if we need to grow
    if (needed_size <= buffer_capacity_) {
        return GROW_OK;
    }

    if (needed_size > config_.max_buffer_size) {
        return GROW_EXCEEDS_MAX;
    }

    // Calculate new capacity: double current size or use needed size, whichever is larger
    size_t new_capacity = buffer_capacity_ * 2;
    if (new_capacity < needed_size) {
        new_capacity = needed_size;
    }

    // Cap at maximum buffer size
    if (new_capacity > config_.max_buffer_size) {
        new_capacity = config_.max_buffer_size;
    }

    void* new_buffer = config_.realloc ? config_.realloc(buffer_, new_capacity)
                                       : std::realloc(buffer_, new_capacity);
    if (!new_buffer) {
        return GROW_ALLOCATION_FAILED;
    }

    buffer_ = static_cast<uint8_t*>(new_buffer);
    buffer_capacity_ = new_capacity;

#ifdef MICRO_OGG_STREAM_DEBUG
    if (new_capacity > peak_buffer_capacity_) {
        peak_buffer_capacity_ = new_capacity;
    }
#endif

    return GROW_OK;
}

}  // namespace micro_ogg_stream
