#include "mptree/decode.hpp"
#include "mptree/encode.hpp"
#include "mptree/json_bridge.hpp"
#include "config.hpp"
#include "logger.hpp"

#include <print>
#include <format>
#include <span>
#include <expected>
#include <string>
#include <string_view>
#include <fstream>
#include <iterator>
#include <algorithm>

namespace
{

void print_usage(const char* prog)
{
    std::println("Usage: {} <command> [args]", prog);
    std::println("Commands:");
    std::println("  unpack <file> [--pretty]     Print a MessagePack file as JSON");
    std::println("  pack <json-file> <out-file>  Write the MessagePack form of a JSON entry");
    std::println("  check <file>                 Verify the file re-encodes byte for byte");
}

std::expected<bytes::buffer_t, std::string> read_file(const std::string& path)
{
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open())
    {
        return std::unexpected(std::format("Failed to open {}", path));
    }
    std::string raw{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
    if (in.bad())
    {
        return std::unexpected(std::format("Failed to read {}", path));
    }
    return bytes::to_bytes(raw);
}

std::string describe(const mptree::DecodeError& e)
{
    return std::format("{} ({})", e.message, mptree::errc_str(e.code));
}

int cmd_unpack(const Config& cfg, const std::string& path, bool pretty)
{
    auto data = read_file(path);
    if (!data)
    {
        std::println(stderr, "{}", data.error());
        return 1;
    }

    auto decoded = mptree::decode_prefix(*data, {.max_depth = cfg.decoder().max_depth});
    if (!decoded)
    {
        std::println(stderr, "Decode failed: {}", describe(decoded.error()));
        return 1;
    }
    if (decoded->consumed < data->size())
    {
        LOG_WARN("{}: ignoring {} trailing byte(s)", path, data->size() - decoded->consumed);
    }

    auto jv = mptree::to_json(decoded->entry);
    std::println("{}", pretty ? mptree::pretty_print(jv) : json::serialize(jv));
    return 0;
}

int cmd_pack(const Config& cfg, const std::string& in_path, const std::string& out_path)
{
    auto text = read_file(in_path);
    if (!text)
    {
        std::println(stderr, "{}", text.error());
        return 1;
    }

    auto encoded = mptree::pack_json(std::string_view(reinterpret_cast<const char*>(text->data()), text->size()),
                                     cfg.decoder().max_depth);
    if (!encoded)
    {
        std::println(stderr, "Pack failed: {}", encoded.error());
        return 1;
    }

    std::ofstream out(out_path, std::ios::binary | std::ios::trunc);
    if (!out.is_open())
    {
        std::println(stderr, "Failed to open {} for writing", out_path);
        return 1;
    }
    out.write(reinterpret_cast<const char*>(encoded->data()), static_cast<std::streamsize>(encoded->size()));
    if (!out)
    {
        std::println(stderr, "Failed to write {}", out_path);
        return 1;
    }

    LOG_INFO("Wrote {} byte(s) to {}", encoded->size(), out_path);
    return 0;
}

int cmd_check(const Config& cfg, const std::string& path)
{
    auto data = read_file(path);
    if (!data)
    {
        std::println(stderr, "{}", data.error());
        return 1;
    }

    auto decoded = mptree::decode_prefix(*data, {.max_depth = cfg.decoder().max_depth});
    if (!decoded)
    {
        std::println(stderr, "Decode failed: {}", describe(decoded.error()));
        return 1;
    }

    auto encoded = mptree::encode(decoded->entry);
    auto original = std::span{*data}.first(decoded->consumed);
    auto trailing = data->size() - decoded->consumed;

    if (!std::ranges::equal(encoded, original))
    {
        auto [mis, _] = std::ranges::mismatch(encoded, original);
        std::println("{}: re-encoding differs at byte {} ({} vs {} byte(s))",
                     path, std::distance(encoded.begin(), mis), encoded.size(), original.size());
        return 1;
    }

    std::println("{}: {} byte(s) round-trip exactly, {} trailing byte(s) ignored", path, original.size(), trailing);
    return 0;
}

} // namespace

int main(int argc, char** argv)
{
    if (argc < 2)
    {
        print_usage(argv[0]);
        return 1;
    }

    auto config = Config::load_or_defaults("mptree_config.json");

    auto log_cfg = config.logging();
    if (auto result = Logger::init(log_cfg.level, log_cfg.file, log_cfg.max_size_mb, log_cfg.enable_console);
        !result)
    {
        std::println(stderr, "Failed to initialize logger: {}", result.error());
        return 1;
    }

    std::string cmd = argv[1];
    int rc = 1;

    if (cmd == "unpack" && argc == 3)
    {
        rc = cmd_unpack(config, argv[2], config.output().pretty);
    }
    else if (cmd == "unpack" && argc == 4 && std::string_view(argv[3]) == "--pretty")
    {
        rc = cmd_unpack(config, argv[2], true);
    }
    else if (cmd == "pack" && argc == 4)
    {
        rc = cmd_pack(config, argv[2], argv[3]);
    }
    else if (cmd == "check" && argc == 3)
    {
        rc = cmd_check(config, argv[2]);
    }
    else
    {
        print_usage(argv[0]);
    }

    Logger::shutdown();
    return rc;
}
