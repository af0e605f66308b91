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

#include <micro_ogg_stream/ogg_io.h>

#include <algorithm>
#include <cstring>

namespace micro_ogg_stream {

OggMemorySource::OggMemorySource(const uint8_t* data, size_t len, size_t max_chunk)
    : data_(data), len_(data ? len : 0), max_chunk_(max_chunk) {
}

bool OggMemorySource::read(uint8_t* buffer, size_t capacity, size_t& bytes_read) {
    size_t to_copy = std::min(capacity, len_ - position_);
    if (max_chunk_ > 0) {
        to_copy = std::min(to_copy, max_chunk_);
    }

    if (to_copy > 0) {
        std::memcpy(buffer, data_ + position_, to_copy);
        position_ += to_copy;
    }
    bytes_read = to_copy;
    return true;
}

bool OggVectorSink::write(const uint8_t* data, size_t len) {
    if (len == 0) {
        return true;
    }
    if (!data) {
        return false;
    }
    bytes_.insert(bytes_.end(), data, data + len);
    return true;
}

bool OggFileSource::read(uint8_t* buffer, size_t capacity, size_t& bytes_read) {
    bytes_read = 0;
    if (!file_) {
        return false;
    }
    if (capacity == 0) {
        return true;
    }

    bytes_read = std::fread(buffer, 1, capacity, file_);
    if (bytes_read < capacity && std::ferror(file_)) {
        return false;
    }
    return true;
}

bool OggFileSink::write(const uint8_t* data, size_t len) {
    if (!file_) {
        return false;
    }
    if (len == 0) {
        return true;
    }
    return std::fwrite(data, 1, len, file_) == len;
}

bool OggFileSink::flush() {
    return file_ && std::fflush(file_) == 0;
}

}  // namespace micro_ogg_stream
