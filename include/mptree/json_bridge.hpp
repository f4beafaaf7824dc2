#pragma once
#include "mptree/types.hpp"
#include "mptree/decode.hpp"
#include "fundamentals/bytes.hpp"
#include <boost/json.hpp>
#include <span>
#include <string>
#include <string_view>
#include <expected>

namespace mptree
{

/**
 * JSON form of an Entry:
 *   {"raw_marker": 195, "basic_type": "Bool", "data": {"type": "Bool", "value": true}}
 *
 * Binary payloads are arrays of byte values, map entries are [key, value]
 * arrays, Null carries no "value". Non-finite floats become null and are
 * rejected when read back. from_json also rejects a raw_marker the encoder
 * would not write for the data.
 */
boost::json::value to_json(const Entry& entry);
std::expected<Entry, std::string> from_json(const boost::json::value& jv);

// Two-space indentation, one member per line
std::string pretty_print(const boost::json::value& jv);

std::expected<std::string, std::string> unpack_json(std::span<const std::byte> data, bool pretty = false);
// max_depth bounds container nesting the same way DecodeOptions::max_depth does
std::expected<bytes::buffer_t, std::string> pack_json(std::string_view text,
                                                      size_t max_depth = DecodeOptions::default_max_depth);

} // namespace mptree
