#pragma once
#include "mptree/types.hpp"
#include "fundamentals/bytes.hpp"
#include <ostream>
#include <string>
#include <expected>
#include <cstdint>

namespace mptree
{

namespace detail
{

void write(bytes::buffer_t& out, const Value& v);

} // namespace detail

/**
 * Append the wire encoding of an Entry or a bare Value.
 * The width recorded in the variant is always reproduced, even if a
 * shorter encoding exists; lengths come from the payload itself.
 */
template<value_holder V>
void write_value(bytes::buffer_t& out, const V& v)
{
    detail::write(out, get_value(v));
}

// Marker byte the encoder writes for v; decode always records exactly this byte
uint8_t marker_of(const Value& v);

bytes::buffer_t encode(const Entry& entry);

// Writes to an external sink; a failed stream is reported, nothing is retried
std::expected<void, std::string> encode_to(std::ostream& os, const Entry& entry);

} // namespace mptree
