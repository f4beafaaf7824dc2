#pragma once
#include "mptree/types.hpp"
#include <span>
#include <string>
#include <expected>
#include <cstddef>
#include <cstdint>

namespace mptree
{

struct DecodeError
{
    enum class errc
    {
        truncated = 1,
        invalid_utf8 = 2,
        unsupported = 3,
        reserved_marker = 4,
        too_deep = 5
    };

    errc code;
    size_t offset;       // where the failing read started
    std::string message;
};

struct DecodeOptions
{
    static constexpr size_t default_max_depth = 512;

    size_t max_depth = default_max_depth;
};

// Entry plus the number of bytes it occupied
struct Decoded
{
    Entry entry;
    size_t consumed;
};

std::expected<Entry, DecodeError> decode(std::span<const std::byte> data);
std::expected<Entry, DecodeError> decode_with(std::span<const std::byte> data, const DecodeOptions& opts);
std::expected<Decoded, DecodeError> decode_prefix(std::span<const std::byte> data, const DecodeOptions& opts = {});

std::string_view errc_str(DecodeError::errc e);

} // namespace mptree
