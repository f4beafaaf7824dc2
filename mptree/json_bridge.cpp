#include "mptree/json_bridge.hpp"
#include "mptree/decode.hpp"
#include "mptree/encode.hpp"
#include "fundamentals/json_utils.hpp"
#include "fundamentals/utf8.hpp"
#include "logger.hpp"

#include <array>
#include <cmath>
#include <format>
#include <limits>
#include <utility>
#include <variant>

namespace mptree
{

namespace json = boost::json;

namespace
{

constexpr size_t kind_count = std::variant_size_v<Value>;

// Largest length (or count) each sized family can carry
constexpr uint64_t max_len(Kind k)
{
    switch (k)
    {
        case Kind::FixStr:
            return 31;
        case Kind::FixArray:
        case Kind::FixMap:
            return 15;
        case Kind::Str8:
        case Kind::Bin8:
            return std::numeric_limits<uint8_t>::max();
        case Kind::Str16:
        case Kind::Bin16:
        case Kind::Array16:
        case Kind::Map16:
            return std::numeric_limits<uint16_t>::max();
        default:
            return std::numeric_limits<uint32_t>::max();
    }
}

json::value entry_to_json(const Entry& e);

struct PayloadToJson
{
    json::object& data;

    void operator()(const Null&) {}

    template<Kind K, class T>
    void operator()(const Wire<K, T>& w)
    {
        if constexpr (std::is_same_v<T, bool>)
        {
            data.emplace("value", w.value);
        }
        else if constexpr (std::is_floating_point_v<T>)
        {
            if (std::isfinite(w.value))
            {
                data.emplace("value", static_cast<double>(w.value));
            }
            else
            {
                data.emplace("value", nullptr);
            }
        }
        else if constexpr (std::is_unsigned_v<T>)
        {
            data.emplace("value", static_cast<uint64_t>(w.value));
        }
        else if constexpr (std::is_signed_v<T>)
        {
            data.emplace("value", static_cast<int64_t>(w.value));
        }
        else if constexpr (std::is_same_v<T, std::string>)
        {
            data.emplace("value", json::string_view(w.value));
        }
        else if constexpr (std::is_same_v<T, bin_t>)
        {
            json::array arr;
            arr.reserve(w.value.size());
            for (auto b : w.value)
            {
                arr.emplace_back(std::to_integer<uint64_t>(b));
            }
            data.emplace("value", std::move(arr));
        }
        else if constexpr (std::is_same_v<T, array_t>)
        {
            json::array arr;
            arr.reserve(w.value.size());
            for (const auto& item : w.value)
            {
                arr.push_back(entry_to_json(item));
            }
            data.emplace("value", std::move(arr));
        }
        else
        {
            json::array arr;
            arr.reserve(w.value.size());
            for (const auto& [k, v] : w.value)
            {
                json::array pair;
                pair.push_back(entry_to_json(k));
                pair.push_back(entry_to_json(v));
                arr.push_back(std::move(pair));
            }
            data.emplace("value", std::move(arr));
        }
    }
};

json::value entry_to_json(const Entry& e)
{
    json::object data;
    data.emplace("type", json::string_view(kind_name(kind_of(e.data()))));
    std::visit(PayloadToJson{data}, e.data());

    json::object obj;
    obj.emplace("raw_marker", static_cast<uint64_t>(e.raw_marker()));
    obj.emplace("basic_type", json::string_view(basic_type_name(e.basic_type())));
    obj.emplace("data", std::move(data));
    return obj;
}

std::expected<Entry, std::string> entry_from_json(const json::value& jv);

template<class W>
std::expected<Value, std::string> payload_from_json(const json::object& data)
{
    if constexpr (std::is_same_v<W, Null>)
    {
        return Null{};
    }
    else
    {
        using T = typename W::value_type;
        constexpr Kind kind = W::kind;
        const auto what = std::format("{} value", kind_name(kind));

        auto field = json_utils::extract(data, "value");
        if (!field)
        {
            return std::unexpected(std::format("{}: {}", kind_name(kind), field.error()));
        }
        const json::value& jv = **field;

        if constexpr (std::is_same_v<T, bool>)
        {
            if (!jv.is_bool())
            {
                return std::unexpected(std::format("{} must be a boolean", what));
            }
            return W{jv.as_bool()};
        }
        else if constexpr (std::is_floating_point_v<T>)
        {
            if (!jv.is_number())
            {
                return std::unexpected(std::format("{} must be a finite number", what));
            }
            return W{static_cast<T>(jv.to_number<double>())};
        }
        else if constexpr (std::is_integral_v<T>)
        {
            auto n = json_utils::to_int<T>(jv, what);
            if (!n)
            {
                return std::unexpected(n.error());
            }
            if constexpr (kind == Kind::FixPos)
            {
                if (*n > 127)
                {
                    return std::unexpected(std::format("{} must be between 0 and 127", what));
                }
            }
            if constexpr (kind == Kind::FixNeg)
            {
                if (*n < -32 || *n > -1)
                {
                    return std::unexpected(std::format("{} must be between -32 and -1", what));
                }
            }
            return W{*n};
        }
        else
        {
            T out;
            if constexpr (std::is_same_v<T, std::string>)
            {
                if (!jv.is_string())
                {
                    return std::unexpected(std::format("{} must be a string", what));
                }
                const auto& s = jv.as_string();
                out.assign(s.data(), s.size());
                if (auto ok = utf8::validate(std::as_bytes(std::span{out})); !ok)
                {
                    return std::unexpected(std::format("{} is not valid UTF-8: {}", what, ok.error()));
                }
            }
            else
            {
                if (!jv.is_array())
                {
                    return std::unexpected(std::format("{} must be an array", what));
                }
                const auto& arr = jv.as_array();
                out.reserve(arr.size());
                for (const auto& item : arr)
                {
                    if constexpr (std::is_same_v<T, bin_t>)
                    {
                        auto b = json_utils::to_int<uint8_t>(item, "byte");
                        if (!b)
                        {
                            return std::unexpected(std::format("{}: {}", what, b.error()));
                        }
                        out.push_back(bytes::int2byte(*b));
                    }
                    else if constexpr (std::is_same_v<T, array_t>)
                    {
                        auto child = entry_from_json(item);
                        if (!child)
                        {
                            return std::unexpected(std::move(child.error()));
                        }
                        out.push_back(std::move(*child));
                    }
                    else
                    {
                        if (!item.is_array() || item.as_array().size() != 2)
                        {
                            return std::unexpected(std::format("{}: map entries must be [key, value] pairs", what));
                        }
                        auto k = entry_from_json(item.as_array()[0]);
                        if (!k)
                        {
                            return std::unexpected(std::move(k.error()));
                        }
                        auto v = entry_from_json(item.as_array()[1]);
                        if (!v)
                        {
                            return std::unexpected(std::move(v.error()));
                        }
                        out.push_back(KeyValue{std::move(*k), std::move(*v)});
                    }
                }
            }

            if (out.size() > max_len(kind))
            {
                return std::unexpected(std::format("{} holds {} element(s), {} allows at most {}",
                                                   what, out.size(), kind_name(kind), max_len(kind)));
            }
            return W{std::move(out)};
        }
    }
}

using payload_parser = std::expected<Value, std::string> (*)(const json::object&);

// Indexed by Kind, same order as Value's alternatives
constexpr auto payload_parsers = []<size_t... I>(std::index_sequence<I...>)
{
    return std::array<payload_parser, kind_count>{
        &payload_from_json<std::variant_alternative_t<I, Value>>...
    };
}(std::make_index_sequence<kind_count>{});

std::expected<Kind, std::string> kind_from_name(std::string_view name)
{
    for (size_t i = 0; i < kind_count; ++i)
    {
        if (kind_name(static_cast<Kind>(i)) == name)
        {
            return static_cast<Kind>(i);
        }
    }
    return std::unexpected(std::format("unknown value type \"{}\"", name));
}

std::expected<Entry, std::string> entry_from_json(const json::value& jv)
{
    if (!jv.is_object())
    {
        return std::unexpected("entry must be a JSON object");
    }
    const auto& obj = jv.as_object();

    auto raw = json_utils::extract(obj, "raw_marker");
    if (!raw)
    {
        return std::unexpected(raw.error());
    }
    auto marker = json_utils::to_int<uint8_t>(**raw, "\"raw_marker\"");
    if (!marker)
    {
        return std::unexpected(marker.error());
    }

    auto btype = json_utils::extract_str(obj, "basic_type");
    if (!btype)
    {
        return std::unexpected(btype.error());
    }

    auto data_field = json_utils::extract(obj, "data");
    if (!data_field)
    {
        return std::unexpected(data_field.error());
    }
    if (!(*data_field)->is_object())
    {
        return std::unexpected("\"data\" must be an object");
    }
    const auto& data = (*data_field)->as_object();

    auto type = json_utils::extract_str(data, "type");
    if (!type)
    {
        return std::unexpected(type.error());
    }
    auto kind = kind_from_name(*type);
    if (!kind)
    {
        return std::unexpected(kind.error());
    }

    auto value = payload_parsers[static_cast<size_t>(*kind)](data);
    if (!value)
    {
        return std::unexpected(std::move(value.error()));
    }

    Entry entry(*marker, std::move(*value));
    if (basic_type_name(entry.basic_type()) != *btype)
    {
        return std::unexpected(std::format("basic_type \"{}\" does not match {} (expected \"{}\")",
                                           *btype, *type, basic_type_name(entry.basic_type())));
    }
    // the encoder derives the marker from data, so a mismatch would not survive a round trip
    if (auto want = marker_of(entry.data()); want != entry.raw_marker())
    {
        return std::unexpected(std::format("raw_marker {} does not match {} (expected {})",
                                           entry.raw_marker(), *type, want));
    }
    return entry;
}

void pretty_to(std::string& os, const json::value& jv, std::string& indent)
{
    switch (jv.kind())
    {
        case json::kind::object:
        {
            const auto& obj = jv.get_object();
            if (obj.empty())
            {
                os += "{}";
                break;
            }
            os += "{\n";
            indent.append(2, ' ');
            bool first = true;
            for (const auto& kv : obj)
            {
                if (!first)
                {
                    os += ",\n";
                }
                first = false;
                os += indent;
                os += json::serialize(json::value(kv.key()));
                os += ": ";
                pretty_to(os, kv.value(), indent);
            }
            indent.resize(indent.size() - 2);
            os += "\n";
            os += indent;
            os += "}";
            break;
        }
        case json::kind::array:
        {
            const auto& arr = jv.get_array();
            if (arr.empty())
            {
                os += "[]";
                break;
            }
            os += "[\n";
            indent.append(2, ' ');
            bool first = true;
            for (const auto& item : arr)
            {
                if (!first)
                {
                    os += ",\n";
                }
                first = false;
                os += indent;
                pretty_to(os, item, indent);
            }
            indent.resize(indent.size() - 2);
            os += "\n";
            os += indent;
            os += "]";
            break;
        }
        default:
            os += json::serialize(jv);
            break;
    }
}

} // namespace

json::value to_json(const Entry& entry)
{
    return entry_to_json(entry);
}

std::expected<Entry, std::string> from_json(const json::value& jv)
{
    return entry_from_json(jv);
}

std::string pretty_print(const json::value& jv)
{
    std::string out;
    std::string indent;
    pretty_to(out, jv, indent);
    return out;
}

std::expected<std::string, std::string> unpack_json(std::span<const std::byte> data, bool pretty)
{
    auto entry = decode(data);
    if (!entry)
    {
        return std::unexpected(std::format("decode error ({}): {}", errc_str(entry.error().code), entry.error().message));
    }
    auto jv = to_json(*entry);
    return pretty ? pretty_print(jv) : json::serialize(jv);
}

std::expected<bytes::buffer_t, std::string> pack_json(std::string_view text, size_t max_depth)
{
    // A map level costs four JSON levels (entry, data, value, [key, value]), arrays three
    json::parse_options opts;
    opts.max_depth = 4 * max_depth + 3;
    // F64 payloads must come back bit-exact
    opts.numbers = json::number_precision::precise;

    boost::system::error_code ec;
    auto jv = json::parse(text, ec, {}, opts);
    if (ec)
    {
        return std::unexpected(std::format("JSON parse error: {}", ec.message()));
    }

    auto entry = from_json(jv);
    if (!entry)
    {
        LOG_DEBUG("pack_json rejected input: {}", entry.error());
        return std::unexpected(std::move(entry.error()));
    }
    return encode(*entry);
}

} // namespace mptree
