#include <catch2/catch_test_macros.hpp>

#include "mptree/encode.hpp"
#include "mptree/decode.hpp"
#include "fundamentals/bytes.hpp"

#include <limits>
#include <sstream>
#include <string>

using namespace mptree;
using bytes::to_bytes;
using bytes::buffer_t;

namespace
{

buffer_t encode_value(const Value& v)
{
    buffer_t out;
    write_value(out, v);
    return out;
}

Entry nil()
{
    return Entry(0xC0, Null{});
}

} // namespace

TEST_CASE("encode writes single-byte markers")
{
    CHECK(encode(Entry(0xC3, Bool{true})) == to_bytes({0xC3}));
    CHECK(encode(Entry(0xC2, Bool{false})) == to_bytes({0xC2}));
    CHECK(encode(nil()) == to_bytes({0xC0}));
}

TEST_CASE("encode masks fixed integers into the marker")
{
    CHECK(encode_value(FixPos{1}) == to_bytes({0x01}));
    CHECK(encode_value(FixPos{127}) == to_bytes({0x7F}));
    CHECK(encode_value(FixPos{0xFF}) == to_bytes({0x7F}));

    CHECK(encode_value(FixNeg{-1}) == to_bytes({0xFF}));
    CHECK(encode_value(FixNeg{-32}) == to_bytes({0xE0}));
    CHECK(encode_value(FixNeg{-5}) == to_bytes({0xFB}));
}

TEST_CASE("encode writes sized integers big-endian")
{
    CHECK(encode_value(U8{0x0A}) == to_bytes({0xCC, 0x0A}));
    CHECK(encode_value(U16{0xFFFF}) == to_bytes({0xCD, 0xFF, 0xFF}));
    CHECK(encode_value(U32{0x01020304}) == to_bytes({0xCE, 0x01, 0x02, 0x03, 0x04}));
    CHECK(encode_value(U64{1}) == to_bytes({0xCF, 0, 0, 0, 0, 0, 0, 0, 0x01}));

    CHECK(encode_value(I8{-125}) == to_bytes({0xD0, 0x83}));
    CHECK(encode_value(I16{-2}) == to_bytes({0xD1, 0xFF, 0xFE}));
    CHECK(encode_value(I32{-1}) == to_bytes({0xD2, 0xFF, 0xFF, 0xFF, 0xFF}));
    CHECK(encode_value(I64{std::numeric_limits<int64_t>::min()})
          == to_bytes({0xD3, 0x80, 0, 0, 0, 0, 0, 0, 0}));
}

TEST_CASE("encode writes IEEE-754 floats big-endian")
{
    CHECK(encode_value(F32{1.5f}) == to_bytes({0xCA, 0x3F, 0xC0, 0x00, 0x00}));
    CHECK(encode_value(F64{-2.0}) == to_bytes({0xCB, 0xC0, 0, 0, 0, 0, 0, 0, 0}));
}

TEST_CASE("encode keeps the recorded string width")
{
    CHECK(encode_value(FixStr{"foo"}) == to_bytes({0xA3, 0x66, 0x6F, 0x6F}));
    CHECK(encode_value(Str8{"foo"}) == to_bytes({0xD9, 0x03, 0x66, 0x6F, 0x6F}));
    CHECK(encode_value(Str16{"foo"}) == to_bytes({0xDA, 0x00, 0x03, 0x66, 0x6F, 0x6F}));
    CHECK(encode_value(Str32{"foo"}) == to_bytes({0xDB, 0x00, 0x00, 0x00, 0x03, 0x66, 0x6F, 0x6F}));
    CHECK(encode_value(FixStr{""}) == to_bytes({0xA0}));
}

TEST_CASE("encode writes binaries with their length prefix")
{
    auto payload = to_bytes({0x00, 0xC1, 0xFF});

    CHECK(encode_value(Bin8{payload}) == to_bytes({0xC4, 0x03, 0x00, 0xC1, 0xFF}));
    CHECK(encode_value(Bin16{payload}) == to_bytes({0xC5, 0x00, 0x03, 0x00, 0xC1, 0xFF}));
    CHECK(encode_value(Bin32{{}}) == to_bytes({0xC6, 0x00, 0x00, 0x00, 0x00}));
}

TEST_CASE("encode writes arrays from their children")
{
    CHECK(encode_value(FixArray{{nil(), Entry(0xC3, Bool{true})}}) == to_bytes({0x92, 0xC0, 0xC3}));
    CHECK(encode_value(Array16{{nil()}}) == to_bytes({0xDC, 0x00, 0x01, 0xC0}));
    CHECK(encode_value(Array32{}) == to_bytes({0xDD, 0x00, 0x00, 0x00, 0x00}));

    // child entries are written from their data, not their marker
    CHECK(encode_value(FixArray{{Entry(0x00, U8{7})}}) == to_bytes({0x91, 0xCC, 0x07}));
}

TEST_CASE("encode writes map pairs key first, in order")
{
    map_t pairs{
        KeyValue{Entry(0xA1, FixStr{"a"}), Entry(0x01, FixPos{1})},
        KeyValue{Entry(0xA1, FixStr{"a"}), Entry(0x02, FixPos{2})},
    };

    CHECK(encode_value(FixMap{pairs}) == to_bytes({0x82, 0xA1, 0x61, 0x01, 0xA1, 0x61, 0x02}));
    CHECK(encode_value(Map16{pairs}) == to_bytes({0xDE, 0x00, 0x02, 0xA1, 0x61, 0x01, 0xA1, 0x61, 0x02}));
    CHECK(encode_value(Map32{}) == to_bytes({0xDF, 0x00, 0x00, 0x00, 0x00}));
}

TEST_CASE("encode derives lengths from the actual element count")
{
    array_t items(300, nil());

    auto a16 = encode_value(Array16{items});
    REQUIRE(a16.size() == 3 + 300);
    CHECK(a16[1] == std::byte{0x01});
    CHECK(a16[2] == std::byte{0x2C});

    std::string text(70000, 'x');
    auto s32 = encode_value(Str32{text});
    REQUIRE(s32.size() == 5 + 70000);
    CHECK(bytes::to_int<uint32_t>(std::span{s32}.subspan(1)) == 70000);

    // fix families keep only the bits the marker has room for
    array_t seventeen(17, nil());
    auto fa = encode_value(FixArray{seventeen});
    CHECK(fa[0] == std::byte{0x91});
}

TEST_CASE("marker_of gives the first encoded byte")
{
    CHECK(marker_of(Null{}) == 0xC0);
    CHECK(marker_of(Bool{false}) == 0xC2);
    CHECK(marker_of(FixPos{5}) == 0x05);
    CHECK(marker_of(FixNeg{-1}) == 0xFF);
    CHECK(marker_of(FixStr{"foo"}) == 0xA3);
    CHECK(marker_of(U8{5}) == 0xCC);
    CHECK(marker_of(F64{0.0}) == 0xCB);
    CHECK(marker_of(Str8{"foo"}) == 0xD9);
    CHECK(marker_of(FixArray{{nil(), nil()}}) == 0x92);
    CHECK(marker_of(Map16{}) == 0xDE);

    for (auto b : {to_bytes({0xDA, 0x00, 0x01, 0x61}), to_bytes({0x81, 0xA1, 0x6B, 0xE0}), to_bytes({0xC4, 0x00})})
    {
        auto e = decode(b);
        REQUIRE(e.has_value());
        CHECK(marker_of(e->data()) == e->raw_marker());
        CHECK(encode(*e)[0] == b[0]);
    }
}

TEST_CASE("write_value treats Entry and Value alike")
{
    Entry e(0x92, FixArray{{nil(), nil()}});

    buffer_t from_entry;
    write_value(from_entry, e);

    buffer_t from_value;
    write_value(from_value, e.data());

    CHECK(from_entry == from_value);
    CHECK(from_entry == encode(e));
}

TEST_CASE("decode(encode(e)) == e for nested trees")
{
    Entry tree(0x83, FixMap{{
        KeyValue{Entry(0xA4, FixStr{"list"}),
                 Entry(0xDC, Array16{{Entry(0xFB, FixNeg{-5}),
                                      Entry(0xCB, F64{0.25}),
                                      Entry(0xD9, Str8{"\xE2\x82\xAC"})}})},
        KeyValue{Entry(0xC5, Bin16{to_bytes({0xDE, 0xAD})}),
                 Entry(0xDF, Map32{{KeyValue{nil(), Entry(0xD3, I64{-9})}}})},
        KeyValue{Entry(0x7F, FixPos{127}), Entry(0xCA, F32{-0.5f})},
    }});

    auto wire = encode(tree);
    auto back = decode(wire);

    REQUIRE(back.has_value());
    CHECK(*back == tree);
    CHECK(back->basic_type() == BasicType::Map);
}

TEST_CASE("encode_to writes to a stream and reports failure")
{
    Entry e(0xA2, FixStr{"hi"});

    std::ostringstream os;
    REQUIRE(encode_to(os, e).has_value());
    CHECK(os.str() == "\xA2hi");

    std::ostringstream bad;
    bad.setstate(std::ios::badbit);
    auto r = encode_to(bad, e);
    REQUIRE(!r.has_value());
    CHECK(!r.error().empty());
}
