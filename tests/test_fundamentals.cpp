#include <catch2/catch_test_macros.hpp>

#include "fundamentals/bytes.hpp"
#include "fundamentals/utf8.hpp"

#include <vector>
#include <cstddef>

using namespace bytes;

TEST_CASE("bytes::to_bytes converts string_view correctly")
{
    auto result = to_bytes("hello");

    REQUIRE(result.size() == 5);
    CHECK(result[0] == std::byte{0x68});
    CHECK(result[1] == std::byte{0x65});
    CHECK(result[2] == std::byte{0x6C});
    CHECK(result[3] == std::byte{0x6C});
    CHECK(result[4] == std::byte{0x6F});
}

TEST_CASE("bytes::to_int reads big-endian integers")
{
    auto data = to_bytes({0x00, 0x00, 0x00, 0x01});
    CHECK(to_int(std::span{data}) == 1u);

    auto wide = to_bytes({0x12, 0x34});
    CHECK(to_int<uint16_t>(wide) == 0x1234);
    CHECK(to_int<int16_t>(to_bytes({0xFF, 0xFE})) == -2);
}

TEST_CASE("bytes::append_int writes big-endian after existing content")
{
    buffer_t out = to_bytes({0xCD});
    append_int(out, uint16_t{0x0102});

    CHECK(out == to_bytes({0xCD, 0x01, 0x02}));

    append_int(out, int32_t{-1});
    CHECK(out.size() == 7);
    CHECK(out[6] == std::byte{0xFF});
}

TEST_CASE("bytes::append_float writes IEEE-754 bit patterns")
{
    buffer_t out;
    append_float(out, 1.0f);
    CHECK(out == to_bytes({0x3F, 0x80, 0x00, 0x00}));

    out.clear();
    append_float(out, -2.0);
    CHECK(out == to_bytes({0xC0, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00}));
}

TEST_CASE("utf8::validate accepts well-formed text")
{
    CHECK(utf8::validate(to_bytes("")).has_value());
    CHECK(utf8::validate(to_bytes("plain ascii")).has_value());
    CHECK(utf8::validate(to_bytes("caf\xC3\xA9")).has_value());
    CHECK(utf8::validate(to_bytes("\xE2\x82\xAC")).has_value());
    CHECK(utf8::validate(to_bytes("\xF0\x9F\x98\x80")).has_value());
}

TEST_CASE("utf8::validate rejects malformed sequences")
{
    SECTION("stray continuation byte")
    {
        auto r = utf8::validate(to_bytes({0x61, 0x80}));
        REQUIRE(!r.has_value());
        CHECK(r.error().find("index 1") != std::string::npos);
    }
    SECTION("truncated sequence")
    {
        CHECK(!utf8::validate(to_bytes({0xE2, 0x82})).has_value());
    }
    SECTION("overlong encoding")
    {
        CHECK(!utf8::validate(to_bytes({0xC0, 0xAF})).has_value());
        CHECK(!utf8::validate(to_bytes({0xE0, 0x80, 0xAF})).has_value());
    }
    SECTION("surrogate code point")
    {
        CHECK(!utf8::validate(to_bytes({0xED, 0xA0, 0x80})).has_value());
    }
    SECTION("beyond U+10FFFF")
    {
        CHECK(!utf8::validate(to_bytes({0xF4, 0x90, 0x80, 0x80})).has_value());
        CHECK(!utf8::validate(to_bytes({0xF8, 0x88, 0x80, 0x80})).has_value());
    }
}
