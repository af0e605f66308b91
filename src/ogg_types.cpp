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

#include <micro_ogg_stream/ogg_types.h>

namespace micro_ogg_stream {

const char* ogg_result_to_string(OggResult result) {
    switch (result) {
        case OGG_OK:
            return "OGG_OK";
        case OGG_END_OF_INPUT:
            return "OGG_END_OF_INPUT";
        case OGG_MALFORMED_HEADER:
            return "OGG_MALFORMED_HEADER";
        case OGG_CHECKSUM_MISMATCH:
            return "OGG_CHECKSUM_MISMATCH";
        case OGG_TRUNCATED:
            return "OGG_TRUNCATED";
        case OGG_CAPACITY_EXCEEDED:
            return "OGG_CAPACITY_EXCEEDED";
        case OGG_SINK_FAILURE:
            return "OGG_SINK_FAILURE";
        case OGG_SOURCE_FAILURE:
            return "OGG_SOURCE_FAILURE";
        case OGG_ALLOCATION_FAILED:
            return "OGG_ALLOCATION_FAILED";
    }
    return "OGG_UNKNOWN";
}

}  // namespace micro_ogg_stream
