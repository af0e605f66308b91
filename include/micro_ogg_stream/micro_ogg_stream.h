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

/* microOggStream - Lightweight Ogg page codec with streaming reader and writer
 * Implements RFC 3533 page framing
 *
 * Platform-agnostic, zero dependencies
 */

#ifndef MICRO_OGG_STREAM_H
#define MICRO_OGG_STREAM_H

#include <micro_ogg_stream/ogg_io.h>
#include <micro_ogg_stream/ogg_page.h>
#include <micro_ogg_stream/ogg_stream_reader.h>
#include <micro_ogg_stream/ogg_stream_writer.h>
#include <micro_ogg_stream/ogg_types.h>

#endif  // MICRO_OGG_STREAM_H
