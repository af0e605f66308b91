// tests/test_ogg_io.cpp
#include "tests.hpp"
#include "test_support.hpp"

#include <cstdio>

#include "micro_ogg_stream/ogg_io.h"

using namespace micro_ogg_stream;
using test_support::make_payload;

TEST_SUITE("ogg/io") {

    TEST_CASE("memory source honours the chunk limit") {
        auto payload = make_payload(10);
        OggMemorySource source(payload.data(), payload.size(), 3);

        std::uint8_t buffer[16] = {};
        std::size_t n = 0;
        REQUIRE(source.read(buffer, sizeof(buffer), n));
        CHECK(n == 3);
        REQUIRE(source.read(buffer + 3, 2, n));
        CHECK(n == 2);
        CHECK(source.position() == 5);
        CHECK(source.remaining() == 5);

        std::size_t total = 5;
        while (source.read(buffer + total, sizeof(buffer) - total, n) && n > 0) {
            total += n;
        }
        CHECK(total == 10);
        CHECK(std::vector<std::uint8_t>(buffer, buffer + 10) == payload);

        // Exhausted: success with zero bytes
        CHECK(source.read(buffer, sizeof(buffer), n));
        CHECK(n == 0);
    }

    TEST_CASE("vector sink appends") {
        OggVectorSink sink;
        const std::uint8_t a[] = {1, 2, 3};
        const std::uint8_t b[] = {4};
        CHECK(sink.write(a, 3));
        CHECK(sink.write(b, 1));
        CHECK(sink.write(nullptr, 0));
        CHECK(sink.flush());
        CHECK(sink.bytes() == std::vector<std::uint8_t>{1, 2, 3, 4});
        sink.clear();
        CHECK(sink.bytes().empty());
    }

    TEST_CASE("stdio adapters") {
        FILE* file = std::tmpfile();
        REQUIRE(file != nullptr);

        auto payload = make_payload(5000);
        OggFileSink sink(file);
        CHECK(sink.write(payload.data(), payload.size()));
        CHECK(sink.flush());

        std::rewind(file);
        OggFileSource source(file);
        std::vector<std::uint8_t> back(payload.size() + 10);
        std::size_t total = 0;
        std::size_t n = 0;
        while (source.read(back.data() + total, back.size() - total, n) && n > 0) {
            total += n;
        }
        back.resize(total);
        CHECK(back == payload);

        std::fclose(file);
    }

    TEST_CASE("stdio adapters without a stream fail") {
        OggFileSink sink(nullptr);
        OggFileSource source(nullptr);
        std::uint8_t byte = 0;
        std::size_t n = 0;
        CHECK_FALSE(sink.write(&byte, 1));
        CHECK_FALSE(sink.flush());
        CHECK_FALSE(source.read(&byte, 1, n));
    }
}
