#include "config.hpp"

#include <fstream>
#include <sstream>
#include <format>
#include <concepts>
#include <cstdint>

namespace {

template<std::unsigned_integral Ty>
std::expected<Ty, std::string> get_uint(const json::object& obj, std::string_view key,
                                        Ty min_val, Ty max_val, Ty default_val)
{
    auto it = obj.find(key);
    if (it == obj.end())
    {
        return default_val;
    }
    if (!it->value().is_int64() && !it->value().is_uint64())
    {
        return std::unexpected(std::format("'{}' must be an integer", key));
    }
    if (it->value().is_int64() && it->value().get_int64() < 0)
    {
        return std::unexpected(std::format("'{}' must be between {} and {}",
                                           key, min_val, max_val));
    }
    auto val = it->value().to_number<uint64_t>();
    if (val < static_cast<uint64_t>(min_val) || val > static_cast<uint64_t>(max_val))
    {
        return std::unexpected(std::format("'{}' must be between {} and {}",
                                           key, min_val, max_val));
    }
    return static_cast<Ty>(val);
}

std::string get_string(const json::object& obj, std::string_view key, std::string_view default_val)
{
    auto it = obj.find(key);
    if (it == obj.end() || !it->value().is_string())
    {
        return std::string(default_val);
    }
    return std::string(it->value().as_string());
}

bool get_bool(const json::object& obj, std::string_view key, bool default_val)
{
    auto it = obj.find(key);
    if (it == obj.end() || !it->value().is_bool())
    {
        return default_val;
    }
    return it->value().as_bool();
}

} // namespace

std::expected<Config, std::string> Config::load(const std::string& filepath)
{
    std::ifstream file(filepath);
    if (!file.is_open())
    {
        return std::unexpected(std::format("Failed to open config file: {}", filepath));
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    json::value jv;
    try
    {
        jv = json::parse(buffer.str());
    }
    catch (const std::exception& e)
    {
        return std::unexpected(std::format("JSON parse error: {}", e.what()));
    }
    return parse(jv);
}

Config Config::load_defaults()
{
    return Config{};
}

Config Config::load_or_defaults(const std::string& filepath)
{
    auto result = load(filepath);
    if (result)
    {
        return *result;
    }
    return load_defaults();
}

std::expected<Config, std::string> Config::parse(const json::value& jv)
{
    if (!jv.is_object())
    {
        return std::unexpected("Config root must be a JSON object");
    }
    const auto& root = jv.as_object();
    Config config;
    if (auto it = root.find("decoder"); it != root.end() && it->value().is_object())
    {
        const auto& dec = it->value().as_object();
        if (auto depth = get_uint<size_t>(dec, "max_depth", 1, 100000, 512); depth)
        {
            config.dec.max_depth = *depth;
        }
        else
        {
            return std::unexpected(depth.error());
        }
    }
    if (auto it = root.find("output"); it != root.end() && it->value().is_object())
    {
        config.out.pretty = get_bool(it->value().as_object(), "pretty", false);
    }
    if (auto it = root.find("logging"); it != root.end() && it->value().is_object())
    {
        const auto& log = it->value().as_object();
        config.log.level = get_string(log, "level", "warn");
        config.log.file = get_string(log, "file", "");
        if (auto max_size = get_uint<size_t>(log, "max_size_mb", 1, 10000, 100); max_size)
        {
            config.log.max_size_mb = *max_size;
        }
        else
        {
            return std::unexpected(max_size.error());
        }
        config.log.enable_console = get_bool(log, "enable_console", true);
    }
    return config;
}
