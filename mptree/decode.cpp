#include "mptree/decode.hpp"
#include "mptree/marker.hpp"
#include "fundamentals/bytes.hpp"
#include "fundamentals/utf8.hpp"
#include "logger.hpp"

#include <algorithm>
#include <bit>
#include <format>
#include <utility>

namespace mptree
{

using namespace bytes;

namespace
{

class Reader
{
public:
    Reader(std::span<const std::byte> d, const DecodeOptions& o) : data(d), opts(o) {}

    [[nodiscard]] size_t pos() const { return off; }

    std::expected<Entry, DecodeError> read_value(size_t depth);

private:
    std::span<const std::byte> data;
    const DecodeOptions& opts;
    size_t off = 0;

    [[nodiscard]] size_t remaining() const { return data.size() - off; }

    std::unexpected<DecodeError> fail(DecodeError::errc code, size_t at, std::string msg) const
    {
        return std::unexpected(DecodeError{code, at, std::move(msg)});
    }

    std::expected<std::span<const std::byte>, DecodeError> take(size_t n, std::string_view what)
    {
        if (n > remaining())
        {
            return fail(DecodeError::errc::truncated, off,
                        std::format("unexpected end of input reading {} at offset {}: need {} byte(s), {} left",
                                    what, off, n, remaining()));
        }
        auto sp = data.subspan(off, n);
        off += n;
        return sp;
    }

    template<std::integral Ty>
    std::expected<Ty, DecodeError> read_int(std::string_view what)
    {
        auto sp = take(sizeof(Ty), what);
        if (!sp)
        {
            return std::unexpected(std::move(sp.error()));
        }
        return to_int<Ty>(*sp);
    }

    template<class W>
    std::expected<Value, DecodeError> read_scalar()
    {
        using T = typename W::value_type;
        if constexpr (std::floating_point<T>)
        {
            using bits_t = std::conditional_t<sizeof(T) == 4, uint32_t, uint64_t>;
            return read_int<bits_t>(kind_name(W::kind))
                .transform([](bits_t b) -> Value { return W{std::bit_cast<T>(b)}; });
        }
        else
        {
            return read_int<T>(kind_name(W::kind))
                .transform([](T v) -> Value { return W{v}; });
        }
    }

    template<std::unsigned_integral Len>
    std::expected<size_t, DecodeError> read_len()
    {
        return read_int<Len>("length").transform([](Len n) { return static_cast<size_t>(n); });
    }

    std::expected<size_t, DecodeError> length_of(Family f, uint8_t m)
    {
        switch (f)
        {
            case Family::FixStr:
                return fixstr_len(m);
            case Family::FixArray:
            case Family::FixMap:
                return fixcnt(m);
            case Family::Str8:
            case Family::Bin8:
                return read_len<uint8_t>();
            case Family::Str16:
            case Family::Bin16:
            case Family::Array16:
            case Family::Map16:
                return read_len<uint16_t>();
            case Family::Str32:
            case Family::Bin32:
            case Family::Array32:
            case Family::Map32:
                return read_len<uint32_t>();
            default:
                std::unreachable();
        }
    }

    template<class W>
    std::expected<Value, DecodeError> read_str(Family f, uint8_t m)
    {
        auto len = length_of(f, m);
        if (!len)
        {
            return std::unexpected(std::move(len.error()));
        }
        auto start = off;
        auto sp = take(*len, "string payload");
        if (!sp)
        {
            return std::unexpected(std::move(sp.error()));
        }
        if (auto ok = utf8::validate(*sp); !ok)
        {
            return fail(DecodeError::errc::invalid_utf8, start,
                        std::format("invalid UTF-8 in {} at offset {}: {}", kind_name(W::kind), start, ok.error()));
        }
        return W{std::string(reinterpret_cast<const char*>(sp->data()), sp->size())};
    }

    template<class W>
    std::expected<Value, DecodeError> read_bin(Family f, uint8_t m)
    {
        auto len = length_of(f, m);
        if (!len)
        {
            return std::unexpected(std::move(len.error()));
        }
        auto sp = take(*len, "binary payload");
        if (!sp)
        {
            return std::unexpected(std::move(sp.error()));
        }
        return W{bin_t(sp->begin(), sp->end())};
    }

    std::expected<void, DecodeError> enter(size_t depth, size_t at)
    {
        if (depth >= opts.max_depth)
        {
            return fail(DecodeError::errc::too_deep, at,
                        std::format("nesting at offset {} exceeds max depth {}", at, opts.max_depth));
        }
        return {};
    }

    template<class W>
    std::expected<Value, DecodeError> read_array(Family f, uint8_t m, size_t depth)
    {
        if (auto ok = enter(depth, off - 1); !ok)
        {
            return std::unexpected(std::move(ok.error()));
        }
        auto len = length_of(f, m);
        if (!len)
        {
            return std::unexpected(std::move(len.error()));
        }

        array_t items;
        // every element takes at least one byte
        items.reserve(std::min(*len, remaining()));
        for (size_t i = 0; i < *len; ++i)
        {
            auto item = read_value(depth + 1);
            if (!item)
            {
                return std::unexpected(std::move(item.error()));
            }
            items.push_back(std::move(*item));
        }
        return W{std::move(items)};
    }

    template<class W>
    std::expected<Value, DecodeError> read_map(Family f, uint8_t m, size_t depth)
    {
        if (auto ok = enter(depth, off - 1); !ok)
        {
            return std::unexpected(std::move(ok.error()));
        }
        auto len = length_of(f, m);
        if (!len)
        {
            return std::unexpected(std::move(len.error()));
        }

        map_t pairs;
        pairs.reserve(std::min(*len, remaining() / 2));
        for (size_t i = 0; i < *len; ++i)
        {
            auto k = read_value(depth + 1);
            if (!k)
            {
                return std::unexpected(std::move(k.error()));
            }
            auto v = read_value(depth + 1);
            if (!v)
            {
                return std::unexpected(std::move(v.error()));
            }
            pairs.push_back(KeyValue{std::move(*k), std::move(*v)});
        }
        return W{std::move(pairs)};
    }
};

std::expected<Entry, DecodeError> Reader::read_value(size_t depth)
{
    auto at = off;
    auto m = read_int<uint8_t>("marker");
    if (!m)
    {
        return std::unexpected(std::move(m.error()));
    }

    auto f = classify(*m);
    std::expected<Value, DecodeError> value;
    switch (f)
    {
        case Family::Null:     value = Null{}; break;
        case Family::False:    value = Bool{false}; break;
        case Family::True:     value = Bool{true}; break;
        case Family::FixPos:   value = FixPos{fixpos_value(*m)}; break;
        case Family::FixNeg:   value = FixNeg{fixneg_value(*m)}; break;

        case Family::U8:       value = read_scalar<U8>(); break;
        case Family::U16:      value = read_scalar<U16>(); break;
        case Family::U32:      value = read_scalar<U32>(); break;
        case Family::U64:      value = read_scalar<U64>(); break;
        case Family::I8:       value = read_scalar<I8>(); break;
        case Family::I16:      value = read_scalar<I16>(); break;
        case Family::I32:      value = read_scalar<I32>(); break;
        case Family::I64:      value = read_scalar<I64>(); break;
        case Family::F32:      value = read_scalar<F32>(); break;
        case Family::F64:      value = read_scalar<F64>(); break;

        case Family::FixStr:   value = read_str<FixStr>(f, *m); break;
        case Family::Str8:     value = read_str<Str8>(f, *m); break;
        case Family::Str16:    value = read_str<Str16>(f, *m); break;
        case Family::Str32:    value = read_str<Str32>(f, *m); break;

        case Family::Bin8:     value = read_bin<Bin8>(f, *m); break;
        case Family::Bin16:    value = read_bin<Bin16>(f, *m); break;
        case Family::Bin32:    value = read_bin<Bin32>(f, *m); break;

        case Family::FixArray: value = read_array<FixArray>(f, *m, depth); break;
        case Family::Array16:  value = read_array<Array16>(f, *m, depth); break;
        case Family::Array32:  value = read_array<Array32>(f, *m, depth); break;

        case Family::FixMap:   value = read_map<FixMap>(f, *m, depth); break;
        case Family::Map16:    value = read_map<Map16>(f, *m, depth); break;
        case Family::Map32:    value = read_map<Map32>(f, *m, depth); break;

        case Family::Ext:
            return fail(DecodeError::errc::unsupported, at,
                        std::format("extension type marker 0x{:02X} at offset {} is not supported", *m, at));
        case Family::Reserved:
            return fail(DecodeError::errc::reserved_marker, at,
                        std::format("reserved marker 0x{:02X} at offset {}", *m, at));
    }

    if (!value)
    {
        return std::unexpected(std::move(value.error()));
    }
    return Entry(*m, std::move(*value));
}

} // namespace

std::expected<Decoded, DecodeError> decode_prefix(std::span<const std::byte> data, const DecodeOptions& opts)
{
    Reader rd(data, opts);
    auto entry = rd.read_value(0);
    if (!entry)
    {
        LOG_DEBUG("decode failed ({}): {}", errc_str(entry.error().code), entry.error().message);
        return std::unexpected(std::move(entry.error()));
    }
    return Decoded{std::move(*entry), rd.pos()};
}

std::expected<Entry, DecodeError> decode_with(std::span<const std::byte> data, const DecodeOptions& opts)
{
    return decode_prefix(data, opts).transform([](Decoded&& d) { return std::move(d.entry); });
}

std::expected<Entry, DecodeError> decode(std::span<const std::byte> data)
{
    return decode_with(data, DecodeOptions{});
}

std::string_view errc_str(DecodeError::errc e)
{
    switch (e)
    {
        case DecodeError::errc::truncated:       return "truncated";
        case DecodeError::errc::invalid_utf8:    return "invalid_utf8";
        case DecodeError::errc::unsupported:     return "unsupported";
        case DecodeError::errc::reserved_marker: return "reserved_marker";
        case DecodeError::errc::too_deep:        return "too_deep";
    }
    return "unknown";
}

} // namespace mptree
