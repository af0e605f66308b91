// tests/test_ogg_lacing.cpp
#include "tests.hpp"
#include "test_support.hpp"

#include <numeric>

#include "micro_ogg_stream/ogg_page.h"

using namespace micro_ogg_stream;
using test_support::make_payload;

namespace {

    std::size_t table_sum(const std::vector<std::uint8_t>& table) {
        return std::accumulate(table.begin(), table.end(), std::size_t{0});
    }

    std::vector<std::uint8_t> lace(std::size_t length) {
        std::vector<std::uint8_t> table;
        REQUIRE(ogg_lace(length, OGG_MAX_SEGMENTS, table) == OGG_OK);
        return table;
    }
}

TEST_SUITE("ogg/lacing") {

    TEST_CASE("table arithmetic for every page payload length") {
        std::vector<std::uint8_t> table;
        for (std::size_t length = 0; length <= OGG_MAX_PAGE_BODY_SIZE; ++length) {
            table.clear();
            REQUIRE(ogg_lace(length, OGG_MAX_SEGMENTS, table) == OGG_OK);
            REQUIRE(table_sum(table) == length);
            REQUIRE(table.size() <= OGG_MAX_SEGMENTS);
            if (length < OGG_MAX_PAGE_BODY_SIZE) {
                // Terminated: exactly one entry below 255, at the end
                REQUIRE(table.size() == length / 255 + 1);
                REQUIRE(table.back() < OGG_MAX_LACING_VALUE);
            }
        }
    }

    TEST_CASE("get_segments recovers a single sub-segment") {
        const auto payload = make_payload(OGG_MAX_PAGE_BODY_SIZE);

        auto check_length = [&payload](std::size_t length) {
            CAPTURE(length);
            OggPage page;
            page.segment_table = lace(length);
            page.data.assign(payload.begin(), payload.begin() + static_cast<std::ptrdiff_t>(length));

            auto segments = page.get_segments();
            REQUIRE(segments.size() == 1);
            CHECK(segments[0] == page.data);
            CHECK(page.get_inner_data() == page.data);
        };

        for (std::size_t length = 0; length <= OGG_MAX_PAGE_BODY_SIZE; length += 97) {
            check_length(length);
        }
        for (std::size_t k = 0; k <= 255; ++k) {
            const std::size_t base = k * 255;
            check_length(base);
            if (base + 1 <= OGG_MAX_PAGE_BODY_SIZE) {
                check_length(base + 1);
            }
            if (base >= 1) {
                check_length(base - 1);
            }
        }
    }

    TEST_CASE("exact multiples of 255 carry an explicit zero terminator") {
        CHECK(lace(0) == std::vector<std::uint8_t>{0});
        CHECK(lace(254) == std::vector<std::uint8_t>{254});
        CHECK(lace(255) == std::vector<std::uint8_t>{255, 0});
        CHECK(lace(256) == std::vector<std::uint8_t>{255, 1});
        CHECK(lace(510) == std::vector<std::uint8_t>{255, 255, 0});

        auto almost_full = lace(254 * 255);
        CHECK(almost_full.size() == 255);
        CHECK(almost_full.back() == 0);
    }

    TEST_CASE("a full page leaves the run open") {
        auto table = lace(OGG_MAX_PAGE_BODY_SIZE);
        CHECK(table.size() == 255);
        CHECK(std::vector<std::uint8_t>(255, 255) == table);

        OggPage page;
        page.segment_table = table;
        page.data.assign(OGG_MAX_PAGE_BODY_SIZE, 0xAB);
        CHECK(page.is_last_segment_continued());
        auto segments = page.get_segments();
        REQUIRE(segments.size() == 1);
        CHECK(segments[0].size() == OGG_MAX_PAGE_BODY_SIZE);
    }

    TEST_CASE("lengths beyond the table room are refused") {
        std::vector<std::uint8_t> table;
        CHECK(ogg_lace(OGG_MAX_PAGE_BODY_SIZE + 1, OGG_MAX_SEGMENTS, table) == OGG_CAPACITY_EXCEEDED);
        CHECK(ogg_lace(600, 2, table) == OGG_CAPACITY_EXCEEDED);
        CHECK(table.empty());

        CHECK(ogg_lace(510, 2, table) == OGG_OK);
        CHECK(table == std::vector<std::uint8_t>{255, 255});
    }

    TEST_CASE("get_segments walks multi sub-segment tables") {
        OggPage page;
        page.segment_table = {3, 255, 2, 0, 255};
        page.data = make_payload(3 + 257 + 0 + 255);

        auto segments = page.get_segments();
        REQUIRE(segments.size() == 4);
        CHECK(segments[0].size() == 3);
        CHECK(segments[1].size() == 257);
        CHECK(segments[2].empty());
        CHECK(segments[3].size() == 255);
        CHECK(page.is_last_segment_continued());

        std::vector<std::uint8_t> joined;
        for (const auto& s : segments) {
            joined.insert(joined.end(), s.begin(), s.end());
        }
        CHECK(joined == page.data);
    }
}

TEST_SUITE("ogg/page write") {

    TEST_CASE("each write is its own sub-segment") {
        OggPage page;
        auto payload = make_payload(330);

        CHECK(page.write(payload.data(), 10) == 10);
        CHECK(page.segment_table == std::vector<std::uint8_t>{10});

        CHECK(page.write(payload.data() + 10, 20) == 20);
        CHECK(page.segment_table == std::vector<std::uint8_t>{10, 20});

        CHECK(page.write(payload.data() + 30, 300) == 300);
        CHECK(page.segment_table == std::vector<std::uint8_t>{10, 20, 255, 45});
        CHECK(page.data == payload);
        CHECK(page.get_inner_data_size() == 330);

        auto segments = page.get_segments();
        REQUIRE(segments.size() == 3);
        CHECK(segments[0] == std::vector<std::uint8_t>(payload.begin(), payload.begin() + 10));
        CHECK(segments[1] == std::vector<std::uint8_t>(payload.begin() + 10, payload.begin() + 30));
        CHECK(segments[2] == std::vector<std::uint8_t>(payload.begin() + 30, payload.end()));
    }

    TEST_CASE("a write of a multiple of 255 keeps its terminator") {
        OggPage page;
        auto payload = make_payload(255 + 3);

        CHECK(page.write(payload.data(), 255) == 255);
        CHECK(page.write(payload.data() + 255, 3) == 3);
        CHECK(page.segment_table == std::vector<std::uint8_t>{255, 0, 3});

        auto segments = page.get_segments();
        REQUIRE(segments.size() == 2);
        CHECK(segments[0].size() == 255);
        CHECK(segments[1].size() == 3);
    }

    TEST_CASE("zero-length and null writes accept nothing") {
        OggPage page;
        std::uint8_t byte = 1;
        CHECK(page.write(&byte, 0) == 0);
        CHECK(page.write(nullptr, 10) == 0);
        CHECK(page.segment_table.empty());
        CHECK_FALSE(page.is_full());
    }

    TEST_CASE("capacity bounds the write") {
        OggPage page;
        auto payload = make_payload(70000);

        CHECK(page.write(payload.data(), payload.size()) == OGG_MAX_PAGE_BODY_SIZE);
        CHECK(page.data.size() == OGG_MAX_PAGE_BODY_SIZE);
        CHECK(page.segment_table == std::vector<std::uint8_t>(255, 255));
        CHECK(page.is_full());

        CHECK(page.write(payload.data(), 1) == 0);
        CHECK(page.data.size() == OGG_MAX_PAGE_BODY_SIZE);
    }

    TEST_CASE("table room bounds later writes") {
        OggPage page;
        auto payload = make_payload(OGG_MAX_PAGE_BODY_SIZE);

        // 200 entries of 255 plus a zero terminator
        CHECK(page.write(payload.data(), 200 * 255) == 200 * 255);
        CHECK(page.segment_table.size() == 201);

        // 54 entries are left; the run stays open
        CHECK(page.write(payload.data() + 200 * 255, 20000) == 54 * 255);
        CHECK(page.segment_table.size() == 255);
        CHECK(page.is_last_segment_continued());
        CHECK(page.is_full());
        CHECK(page.write(payload.data(), 1) == 0);

        std::vector<std::uint8_t> out;
        CHECK(page.to_bytes(out) == OGG_OK);
    }

    TEST_CASE("small writes fill the table before the payload") {
        OggPage page;
        std::uint8_t byte = 7;
        for (std::size_t i = 0; i < OGG_MAX_SEGMENTS; ++i) {
            REQUIRE(page.write(&byte, 1) == 1);
        }
        CHECK(page.is_full());
        CHECK(page.data.size() == OGG_MAX_SEGMENTS);
        CHECK(page.write(&byte, 1) == 0);
        CHECK(page.get_segments().size() == OGG_MAX_SEGMENTS);
    }

    TEST_CASE("an open run is continued by the next write") {
        OggPage page;
        page.segment_table = {10, 255};
        page.data = make_payload(265);

        auto extra = make_payload(5, 9);
        CHECK(page.write(extra.data(), extra.size()) == 5);
        CHECK(page.segment_table == std::vector<std::uint8_t>{10, 255, 5});

        auto segments = page.get_segments();
        REQUIRE(segments.size() == 2);
        CHECK(segments[0].size() == 10);
        CHECK(segments[1].size() == 260);
    }

    TEST_CASE("writes to decoded pages append a sub-segment") {
        OggPage page;
        page.segment_table = {10, 0};
        page.data = make_payload(10);

        auto extra = make_payload(5, 9);
        CHECK(page.write(extra.data(), extra.size()) == 5);
        CHECK(page.segment_table == std::vector<std::uint8_t>{10, 0, 5});

        auto segments = page.get_segments();
        REQUIRE(segments.size() == 3);
        CHECK(segments[0].size() == 10);
        CHECK(segments[1].empty());
        CHECK(segments[2] == extra);
    }

    TEST_CASE("one entry of room takes at most 255 bytes") {
        OggPage page;
        page.segment_table.assign(254, 0);

        auto payload = make_payload(1000);
        CHECK(page.write(payload.data(), payload.size()) == 255);
        CHECK(page.segment_table.size() == 255);
        CHECK(page.segment_table[254] == 255);
        CHECK(page.write(payload.data(), 1) == 0);

        std::vector<std::uint8_t> out;
        CHECK(page.to_bytes(out) == OGG_OK);
    }

    TEST_CASE("clear keeps capacity") {
        OggPage page;
        auto payload = make_payload(5000);
        page.write(payload.data(), payload.size());
        const auto capacity = page.data.capacity();

        page.clear();
        CHECK(page.data.empty());
        CHECK(page.segment_table.empty());
        CHECK(page.data.capacity() == capacity);
    }
}
