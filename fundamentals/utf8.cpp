#include "fundamentals/utf8.hpp"

#include <format>
#include <cstdint>

namespace utf8
{

namespace
{

constexpr bool is_cont(uint8_t b)
{
    return (b & 0xC0) == 0x80;
}

} // namespace

std::expected<void, std::string> validate(std::span<const std::byte> data)
{
    size_t i = 0;
    while (i < data.size())
    {
        auto lead = std::to_integer<uint8_t>(data[i]);
        if (lead < 0x80)
        {
            ++i;
            continue;
        }

        size_t len = 0;
        uint32_t cp = 0;
        if ((lead & 0xE0) == 0xC0)
        {
            len = 2;
            cp = lead & 0x1F;
        }
        else if ((lead & 0xF0) == 0xE0)
        {
            len = 3;
            cp = lead & 0x0F;
        }
        else if ((lead & 0xF8) == 0xF0)
        {
            len = 4;
            cp = lead & 0x07;
        }
        else
        {
            return std::unexpected(std::format("invalid lead byte 0x{:02X} at index {}", lead, i));
        }

        if (i + len > data.size())
        {
            return std::unexpected(std::format("incomplete {}-byte sequence at index {}", len, i));
        }

        for (size_t k = 1; k < len; ++k)
        {
            auto next = std::to_integer<uint8_t>(data[i + k]);
            if (!is_cont(next))
            {
                return std::unexpected(std::format("invalid continuation byte 0x{:02X} at index {}", next, i + k));
            }
            cp = (cp << 6) | (next & 0x3F);
        }

        constexpr uint32_t min_cp[] = {0, 0, 0x80, 0x800, 0x10000};
        if (cp < min_cp[len])
        {
            return std::unexpected(std::format("overlong {}-byte sequence at index {}", len, i));
        }
        if (cp >= 0xD800 && cp <= 0xDFFF)
        {
            return std::unexpected(std::format("surrogate U+{:04X} at index {}", cp, i));
        }
        if (cp > 0x10FFFF)
        {
            return std::unexpected(std::format("code point U+{:X} out of range at index {}", cp, i));
        }

        i += len;
    }
    return {};
}

} // namespace utf8
