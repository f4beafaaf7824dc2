#pragma once

#include <boost/json.hpp>
#include <string>
#include <expected>
#include <cstddef>

namespace json = boost::json;

/**
 * Tool configuration loaded from JSON file.
 * Load-once at startup, immutable thereafter.
 */
class Config
{
public:
    struct DecoderCfg
    {
        size_t max_depth = 512;
    };

    struct OutputCfg
    {
        bool pretty = false;
    };

    struct LoggingCfg
    {
        std::string level = "warn";
        std::string file = "";
        size_t max_size_mb = 100;
        bool enable_console = true;
    };

    [[nodiscard]] static std::expected<Config, std::string> load(const std::string& filepath);
    [[nodiscard]] static Config load_defaults();
    [[nodiscard]] static Config load_or_defaults(const std::string& filepath);

    [[nodiscard]] const DecoderCfg& decoder() const { return dec; }
    [[nodiscard]] const OutputCfg& output() const { return out; }
    [[nodiscard]] const LoggingCfg& logging() const { return log; }

private:
    DecoderCfg dec;
    OutputCfg out;
    LoggingCfg log;

    [[nodiscard]] static std::expected<Config, std::string> parse(const json::value& jv);
};
