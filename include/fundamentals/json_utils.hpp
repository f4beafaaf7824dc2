#pragma once
#include <boost/json.hpp>
#include <string>
#include <string_view>
#include <expected>
#include <format>
#include <concepts>
#include <memory>

namespace json_utils
{

inline std::expected<const boost::json::value*, std::string> extract(const boost::json::object& obj, std::string_view key)
{
    auto it = obj.find(key);
    if (it == obj.end())
    {
        return std::unexpected(std::format("\"{}\" field required", key));
    }
    return std::addressof(it->value());
}

inline std::expected<std::string, std::string> extract_str(const boost::json::object& obj, std::string_view key)
{
    auto it = obj.find(key);
    if (it == obj.end())
    {
        return std::unexpected(std::format("\"{}\" field required", key));
    }
    if (!it->value().is_string())
    {
        return std::unexpected(std::format("\"{}\" must be a string", key));
    }

    return static_cast<std::string>(it->value().as_string());
}

// Exact conversion only: rejects fractions, out-of-range values and non-numbers
template<std::integral Ty>
std::expected<Ty, std::string> to_int(const boost::json::value& jv, std::string_view what)
{
    if (!jv.is_int64() && !jv.is_uint64())
    {
        return std::unexpected(std::format("{} must be an integer", what));
    }
    boost::system::error_code ec;
    auto val = jv.to_number<Ty>(ec);
    if (ec)
    {
        return std::unexpected(std::format("{} is out of range", what));
    }
    return val;
}

} // namespace json_utils
