#pragma once
#include <concepts>
#include <bit>
#include <span>
#include <vector>
#include <cstring>
#include <memory>
#include <cstddef>
#include <cstdint>
#include <string_view>
#include <ranges>
#include <initializer_list>

namespace bytes
{

using buffer_t = std::vector<std::byte>;

inline std::byte int2byte(uint8_t i)
{
    return static_cast<std::byte>(i);
}

// MessagePack is big-endian on the wire
constexpr auto endify(std::integral auto i)
{
    if constexpr(std::endian::native == std::endian::little)
    {
        return std::byteswap(i);
    }
    else
    {
        return i;
    }
}

template<std::integral Ty = uint32_t>
Ty to_int(std::span<const std::byte> from)
{
    Ty ret = 0;
    std::memcpy(std::addressof(ret), from.data(), sizeof(Ty));
    return endify(ret);
}

template<class To, std::integral From>
void from_int(std::span<To> to, From val)
{
    val = endify(val);
    std::memcpy(to.data(), std::addressof(val), sizeof(From));
}

template<std::integral Ty>
void append_int(buffer_t& out, Ty val)
{
    auto pos = out.size();
    out.resize(pos + sizeof(Ty));
    from_int<std::byte>(std::span{out}.subspan(pos), val);
}

template<std::floating_point Ty>
void append_float(buffer_t& out, Ty val)
{
    if constexpr (sizeof(Ty) == 4)
    {
        append_int(out, std::bit_cast<uint32_t>(val));
    }
    else
    {
        append_int(out, std::bit_cast<uint64_t>(val));
    }
}

inline void append(buffer_t& out, std::span<const std::byte> data)
{
    out.insert(out.end(), data.begin(), data.end());
}

inline void append(buffer_t& out, std::string_view sv)
{
    append(out, std::as_bytes(std::span{sv.data(), sv.size()}));
}

inline buffer_t to_bytes(std::string_view sv)
{
    return sv |
        std::views::transform([](char ch){ return int2byte(static_cast<uint8_t>(ch)); }) |
        std::ranges::to<buffer_t>();
}

inline buffer_t to_bytes(std::initializer_list<uint8_t> il)
{
    return il | std::views::transform(int2byte) | std::ranges::to<buffer_t>();
}

} // namespace bytes
