#include "mptree/encode.hpp"
#include "mptree/marker.hpp"

#include <format>
#include <type_traits>
#include <variant>

namespace mptree
{

using namespace bytes;

namespace
{

// Marker and length-field width of every non-fix format
template<Kind K> struct wire_traits;

template<> struct wire_traits<Kind::U8>  { static constexpr uint8_t tag = marker::u8; };
template<> struct wire_traits<Kind::U16> { static constexpr uint8_t tag = marker::u16; };
template<> struct wire_traits<Kind::U32> { static constexpr uint8_t tag = marker::u32; };
template<> struct wire_traits<Kind::U64> { static constexpr uint8_t tag = marker::u64; };
template<> struct wire_traits<Kind::I8>  { static constexpr uint8_t tag = marker::i8; };
template<> struct wire_traits<Kind::I16> { static constexpr uint8_t tag = marker::i16; };
template<> struct wire_traits<Kind::I32> { static constexpr uint8_t tag = marker::i32; };
template<> struct wire_traits<Kind::I64> { static constexpr uint8_t tag = marker::i64; };
template<> struct wire_traits<Kind::F32> { static constexpr uint8_t tag = marker::f32; };
template<> struct wire_traits<Kind::F64> { static constexpr uint8_t tag = marker::f64; };

template<> struct wire_traits<Kind::Str8>    { static constexpr uint8_t tag = marker::str8;    using len_t = uint8_t; };
template<> struct wire_traits<Kind::Str16>   { static constexpr uint8_t tag = marker::str16;   using len_t = uint16_t; };
template<> struct wire_traits<Kind::Str32>   { static constexpr uint8_t tag = marker::str32;   using len_t = uint32_t; };
template<> struct wire_traits<Kind::Bin8>    { static constexpr uint8_t tag = marker::bin8;    using len_t = uint8_t; };
template<> struct wire_traits<Kind::Bin16>   { static constexpr uint8_t tag = marker::bin16;   using len_t = uint16_t; };
template<> struct wire_traits<Kind::Bin32>   { static constexpr uint8_t tag = marker::bin32;   using len_t = uint32_t; };
template<> struct wire_traits<Kind::Array16> { static constexpr uint8_t tag = marker::array16; using len_t = uint16_t; };
template<> struct wire_traits<Kind::Array32> { static constexpr uint8_t tag = marker::array32; using len_t = uint32_t; };
template<> struct wire_traits<Kind::Map16>   { static constexpr uint8_t tag = marker::map16;   using len_t = uint16_t; };
template<> struct wire_traits<Kind::Map32>   { static constexpr uint8_t tag = marker::map32;   using len_t = uint32_t; };

// First byte the encoder writes for a value
struct MarkerOf
{
    uint8_t operator()(const Null&) const
    {
        return marker::nil;
    }

    uint8_t operator()(const Bool& b) const
    {
        return b.value ? marker::true_ : marker::false_;
    }

    uint8_t operator()(const FixPos& n) const
    {
        return n.value & marker::fixpos_mask;
    }

    uint8_t operator()(const FixNeg& n) const
    {
        return (static_cast<uint8_t>(n.value) & marker::fixneg_mask) | marker::fixneg_prefix;
    }

    uint8_t operator()(const FixStr& s) const
    {
        return (static_cast<uint8_t>(s.value.size()) & marker::fixstr_mask) | marker::fixstr_prefix;
    }

    uint8_t operator()(const FixArray& a) const
    {
        return (static_cast<uint8_t>(a.value.size()) & marker::fixcnt_mask) | marker::fixarr_prefix;
    }

    uint8_t operator()(const FixMap& m) const
    {
        return (static_cast<uint8_t>(m.value.size()) & marker::fixcnt_mask) | marker::fixmap_prefix;
    }

    template<Kind K, class T>
    uint8_t operator()(const Wire<K, T>&) const
    {
        return wire_traits<K>::tag;
    }
};

// Everything after the marker
struct PayloadWriter
{
    buffer_t& out;

    template<class Seq>
    void put_items(const Seq& items)
    {
        if constexpr (std::is_same_v<Seq, map_t>)
        {
            for (const auto& [k, v] : items)
            {
                write_value(out, k);
                write_value(out, v);
            }
        }
        else if constexpr (std::is_same_v<Seq, array_t>)
        {
            for (const auto& item : items)
            {
                write_value(out, item);
            }
        }
        else
        {
            append(out, std::as_bytes(std::span{items}));
        }
    }

    // value or length already lives in the marker
    void operator()(const Null&) {}
    void operator()(const Bool&) {}
    void operator()(const FixPos&) {}
    void operator()(const FixNeg&) {}

    void operator()(const FixStr& s) { put_items(s.value); }
    void operator()(const FixArray& a) { put_items(a.value); }
    void operator()(const FixMap& m) { put_items(m.value); }

    // Sized integers, floats, and 8/16/32 strings, binaries, arrays and maps
    template<Kind K, class T>
    void operator()(const Wire<K, T>& w)
    {
        if constexpr (std::is_floating_point_v<T>)
        {
            append_float(out, w.value);
        }
        else if constexpr (std::is_integral_v<T>)
        {
            append_int(out, w.value);
        }
        else
        {
            using len_t = typename wire_traits<K>::len_t;
            append_int(out, static_cast<len_t>(w.value.size()));
            put_items(w.value);
        }
    }
};

} // namespace

namespace detail
{

void write(buffer_t& out, const Value& v)
{
    out.push_back(int2byte(marker_of(v)));
    std::visit(PayloadWriter{out}, v);
}

} // namespace detail

uint8_t marker_of(const Value& v)
{
    return std::visit(MarkerOf{}, v);
}

buffer_t encode(const Entry& entry)
{
    buffer_t out;
    write_value(out, entry);
    return out;
}

std::expected<void, std::string> encode_to(std::ostream& os, const Entry& entry)
{
    auto buf = encode(entry);
    os.write(reinterpret_cast<const char*>(buf.data()), static_cast<std::streamsize>(buf.size()));
    if (!os)
    {
        return std::unexpected(std::format("failed to write {} encoded byte(s)", buf.size()));
    }
    return {};
}

} // namespace mptree
