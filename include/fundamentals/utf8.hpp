#pragma once
#include <span>
#include <string>
#include <expected>
#include <cstddef>

namespace utf8
{

// Strict RFC 3629 check: no overlongs, no surrogates, nothing above U+10FFFF
std::expected<void, std::string> validate(std::span<const std::byte> data);

} // namespace utf8
