#pragma once
#include <cstdint>

namespace mptree
{

// Format family of a marker byte
enum class Family : uint8_t
{
    Null,
    False,
    True,
    FixPos,
    FixNeg,
    U8, U16, U32, U64,
    I8, I16, I32, I64,
    F32, F64,
    FixStr, Str8, Str16, Str32,
    Bin8, Bin16, Bin32,
    FixArray, Array16, Array32,
    FixMap, Map16, Map32,
    Ext,
    Reserved,
};

namespace marker
{

constexpr uint8_t nil       = 0xC0;
constexpr uint8_t reserved  = 0xC1;
constexpr uint8_t false_    = 0xC2;
constexpr uint8_t true_     = 0xC3;
constexpr uint8_t bin8      = 0xC4;
constexpr uint8_t bin16     = 0xC5;
constexpr uint8_t bin32     = 0xC6;
constexpr uint8_t ext8      = 0xC7;
constexpr uint8_t ext16     = 0xC8;
constexpr uint8_t ext32     = 0xC9;
constexpr uint8_t f32       = 0xCA;
constexpr uint8_t f64       = 0xCB;
constexpr uint8_t u8        = 0xCC;
constexpr uint8_t u16       = 0xCD;
constexpr uint8_t u32       = 0xCE;
constexpr uint8_t u64       = 0xCF;
constexpr uint8_t i8        = 0xD0;
constexpr uint8_t i16       = 0xD1;
constexpr uint8_t i32       = 0xD2;
constexpr uint8_t i64       = 0xD3;
constexpr uint8_t fixext1   = 0xD4;
constexpr uint8_t fixext16  = 0xD8;
constexpr uint8_t str8      = 0xD9;
constexpr uint8_t str16     = 0xDA;
constexpr uint8_t str32     = 0xDB;
constexpr uint8_t array16   = 0xDC;
constexpr uint8_t array32   = 0xDD;
constexpr uint8_t map16     = 0xDE;
constexpr uint8_t map32     = 0xDF;

// Fix families: prefix bits and the mask of the embedded value/length
constexpr uint8_t fixpos_mask   = 0x7F;
constexpr uint8_t fixmap_prefix = 0x80;
constexpr uint8_t fixarr_prefix = 0x90;
constexpr uint8_t fixcnt_mask   = 0x0F;
constexpr uint8_t fixstr_prefix = 0xA0;
constexpr uint8_t fixstr_mask   = 0x1F;
constexpr uint8_t fixneg_prefix = 0xE0;
constexpr uint8_t fixneg_mask   = 0x1F;

} // namespace marker

constexpr Family classify(uint8_t b)
{
    if (b <= 0x7F) return Family::FixPos;
    if (b <= 0x8F) return Family::FixMap;
    if (b <= 0x9F) return Family::FixArray;
    if (b <= 0xBF) return Family::FixStr;
    if (b >= 0xE0) return Family::FixNeg;

    switch (b)
    {
        case marker::nil:     return Family::Null;
        case marker::false_:  return Family::False;
        case marker::true_:   return Family::True;
        case marker::bin8:    return Family::Bin8;
        case marker::bin16:   return Family::Bin16;
        case marker::bin32:   return Family::Bin32;
        case marker::f32:     return Family::F32;
        case marker::f64:     return Family::F64;
        case marker::u8:      return Family::U8;
        case marker::u16:     return Family::U16;
        case marker::u32:     return Family::U32;
        case marker::u64:     return Family::U64;
        case marker::i8:      return Family::I8;
        case marker::i16:     return Family::I16;
        case marker::i32:     return Family::I32;
        case marker::i64:     return Family::I64;
        case marker::str8:    return Family::Str8;
        case marker::str16:   return Family::Str16;
        case marker::str32:   return Family::Str32;
        case marker::array16: return Family::Array16;
        case marker::array32: return Family::Array32;
        case marker::map16:   return Family::Map16;
        case marker::map32:   return Family::Map32;
        case marker::ext8:
        case marker::ext16:
        case marker::ext32:
            return Family::Ext;
        default:
            break;
    }

    if (b >= marker::fixext1 && b <= marker::fixext16)
    {
        return Family::Ext;
    }
    return Family::Reserved;
}

// Value bits packed into a fix-family marker
constexpr uint8_t fixpos_value(uint8_t b) { return b & marker::fixpos_mask; }
constexpr int8_t fixneg_value(uint8_t b) { return static_cast<int8_t>((b & marker::fixneg_mask) | marker::fixneg_prefix); }
constexpr uint8_t fixstr_len(uint8_t b) { return b & marker::fixstr_mask; }
constexpr uint8_t fixcnt(uint8_t b) { return b & marker::fixcnt_mask; }

} // namespace mptree
