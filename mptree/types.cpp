#include "mptree/types.hpp"

#include <array>
#include <utility>

namespace mptree
{

namespace
{

constexpr std::array<std::string_view, std::variant_size_v<Value>> kind_names
{
    "Null",
    "Bool",
    "FixPos", "FixNeg",
    "U8", "U16", "U32", "U64",
    "I8", "I16", "I32", "I64",
    "F32", "F64",
    "FixStr", "Str8", "Str16", "Str32",
    "Bin8", "Bin16", "Bin32",
    "FixArray", "Array16", "Array32",
    "FixMap", "Map16", "Map32",
};

} // namespace

BasicType basic_type_of(Kind k)
{
    switch (k)
    {
        case Kind::Null:
            return BasicType::Null;
        case Kind::Bool:
            return BasicType::Bool;
        case Kind::FixPos: case Kind::FixNeg:
        case Kind::U8: case Kind::U16: case Kind::U32: case Kind::U64:
        case Kind::I8: case Kind::I16: case Kind::I32: case Kind::I64:
        case Kind::F32: case Kind::F64:
            return BasicType::Number;
        case Kind::FixStr: case Kind::Str8: case Kind::Str16: case Kind::Str32:
            return BasicType::String;
        case Kind::Bin8: case Kind::Bin16: case Kind::Bin32:
            return BasicType::Bin;
        case Kind::FixArray: case Kind::Array16: case Kind::Array32:
            return BasicType::Array;
        case Kind::FixMap: case Kind::Map16: case Kind::Map32:
            return BasicType::Map;
    }
    std::unreachable();
}

std::string_view kind_name(Kind k)
{
    return kind_names[static_cast<size_t>(k)];
}

std::string_view basic_type_name(BasicType t)
{
    switch (t)
    {
        case BasicType::Null:   return "Null";
        case BasicType::Bool:   return "Bool";
        case BasicType::Number: return "Number";
        case BasicType::String: return "String";
        case BasicType::Bin:    return "Bin";
        case BasicType::Array:  return "Array";
        case BasicType::Map:    return "Map";
    }
    std::unreachable();
}

Entry::Entry(uint8_t raw_marker, Value value)
    : marker(raw_marker), btype(basic_type_of(value)), val(std::move(value))
{
}

bool Entry::operator==(const Entry& other) const
{
    return marker == other.marker && btype == other.btype && val == other.val;
}

} // namespace mptree
