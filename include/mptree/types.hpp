#pragma once
#include <vector>
#include <string>
#include <string_view>
#include <variant>
#include <concepts>
#include <cstddef>
#include <cstdint>

namespace mptree
{

class Entry;
struct KeyValue;

// Coarse category for consumers that don't care about the wire width
enum class BasicType : uint8_t
{
    Null,
    Bool,
    Number,
    String,
    Bin,
    Array,
    Map,
};

// One kind per MessagePack wire format (Ext excluded)
enum class Kind : uint8_t
{
    Null,
    Bool,
    FixPos, FixNeg,
    U8, U16, U32, U64,
    I8, I16, I32, I64,
    F32, F64,
    FixStr, Str8, Str16, Str32,
    Bin8, Bin16, Bin32,
    FixArray, Array16, Array32,
    FixMap, Map16, Map32,
};

using bin_t = std::vector<std::byte>;
using array_t = std::vector<Entry>;
using map_t = std::vector<KeyValue>;

template<Kind K, class T>
struct Wire
{
    using value_type = T;
    static constexpr Kind kind = K;

    T value;

    bool operator==(const Wire&) const = default;
};

struct Null
{
    static constexpr Kind kind = Kind::Null;

    bool operator==(const Null&) const = default;
};

using Bool = Wire<Kind::Bool, bool>;

using FixPos = Wire<Kind::FixPos, uint8_t>;
using FixNeg = Wire<Kind::FixNeg, int8_t>;

using U8  = Wire<Kind::U8, uint8_t>;
using U16 = Wire<Kind::U16, uint16_t>;
using U32 = Wire<Kind::U32, uint32_t>;
using U64 = Wire<Kind::U64, uint64_t>;

using I8  = Wire<Kind::I8, int8_t>;
using I16 = Wire<Kind::I16, int16_t>;
using I32 = Wire<Kind::I32, int32_t>;
using I64 = Wire<Kind::I64, int64_t>;

using F32 = Wire<Kind::F32, float>;
using F64 = Wire<Kind::F64, double>;

using FixStr = Wire<Kind::FixStr, std::string>;
using Str8   = Wire<Kind::Str8, std::string>;
using Str16  = Wire<Kind::Str16, std::string>;
using Str32  = Wire<Kind::Str32, std::string>;

using Bin8  = Wire<Kind::Bin8, bin_t>;
using Bin16 = Wire<Kind::Bin16, bin_t>;
using Bin32 = Wire<Kind::Bin32, bin_t>;

using FixArray = Wire<Kind::FixArray, array_t>;
using Array16  = Wire<Kind::Array16, array_t>;
using Array32  = Wire<Kind::Array32, array_t>;

using FixMap = Wire<Kind::FixMap, map_t>;
using Map16  = Wire<Kind::Map16, map_t>;
using Map32  = Wire<Kind::Map32, map_t>;

// Alternative order follows Kind, so Value::index() == Kind
using Value = std::variant<
    Null,
    Bool,
    FixPos, FixNeg,
    U8, U16, U32, U64,
    I8, I16, I32, I64,
    F32, F64,
    FixStr, Str8, Str16, Str32,
    Bin8, Bin16, Bin32,
    FixArray, Array16, Array32,
    FixMap, Map16, Map32
>;

static_assert(std::variant_size_v<Value> == static_cast<size_t>(Kind::Map32) + 1);

BasicType basic_type_of(Kind k);

std::string_view kind_name(Kind k);
std::string_view basic_type_name(BasicType t);

/**
 * A decoded value together with the marker byte it was read from.
 * basic_type is always derived from data; there is no way to set it directly.
 */
class Entry
{
public:
    Entry(uint8_t raw_marker, Value value);

    [[nodiscard]] uint8_t raw_marker() const { return marker; }
    [[nodiscard]] BasicType basic_type() const { return btype; }
    [[nodiscard]] const Value& data() const { return val; }

    bool operator==(const Entry& other) const;

private:
    uint8_t marker;
    BasicType btype;
    Value val;
};

struct KeyValue
{
    Entry key;
    Entry value;

    bool operator==(const KeyValue&) const = default;
};

inline Kind kind_of(const Value& v)
{
    return static_cast<Kind>(v.index());
}

inline BasicType basic_type_of(const Value& v)
{
    return basic_type_of(kind_of(v));
}

// Entry and Value both expose the Value they hold
inline const Value& get_value(const Entry& e) { return e.data(); }
inline const Value& get_value(const Value& v) { return v; }

template<class T>
concept value_holder = requires(const T& t)
{
    { get_value(t) } -> std::same_as<const Value&>;
};

} // namespace mptree
