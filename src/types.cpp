#include "types.hpp"
#include <array>
#include <utility>

namespace bitwise {

namespace {

constexpr std::array<std::pair<PrimitiveKind, TypeInfo>, 19> kTypes = {{
    {PrimitiveKind::BIT,            {"bit",  Category::Bit,     1,  false, false}},
    {PrimitiveKind::LBIT,           {"lbit", Category::Bit,     1,  false, true }},
    {PrimitiveKind::UNSIGNED_8,     {"u8",   Category::Integer, 8,  false, false}},
    {PrimitiveKind::UNSIGNED_16,    {"u16",  Category::Integer, 16, false, false}},
    {PrimitiveKind::UNSIGNED_16_LE, {"ul16", Category::Integer, 16, false, true }},
    {PrimitiveKind::UNSIGNED_24,    {"u24",  Category::Integer, 24, false, false}},
    {PrimitiveKind::UNSIGNED_24_LE, {"ul24", Category::Integer, 24, false, true }},
    {PrimitiveKind::UNSIGNED_32,    {"u32",  Category::Integer, 32, false, false}},
    {PrimitiveKind::UNSIGNED_32_LE, {"ul32", Category::Integer, 32, false, true }},
    {PrimitiveKind::SIGNED_8,       {"i8",   Category::Integer, 8,  true,  false}},
    {PrimitiveKind::SIGNED_16,      {"i16",  Category::Integer, 16, true,  false}},
    {PrimitiveKind::SIGNED_16_LE,   {"il16", Category::Integer, 16, true,  true }},
    {PrimitiveKind::SIGNED_24,      {"i24",  Category::Integer, 24, true,  false}},
    {PrimitiveKind::SIGNED_24_LE,   {"il24", Category::Integer, 24, true,  true }},
    {PrimitiveKind::SIGNED_32,      {"i32",  Category::Integer, 32, true,  false}},
    {PrimitiveKind::SIGNED_32_LE,   {"il32", Category::Integer, 32, true,  true }},
    {PrimitiveKind::CHAR,           {"char", Category::Char,    8,  false, false}},
    {PrimitiveKind::BCD_BIG,        {"bbcd", Category::Bcd,     8,  false, false}},
    {PrimitiveKind::BCD_LITTLE,     {"lbcd", Category::Bcd,     8,  false, true }},
}};

} // namespace

const TypeInfo& typeInfo(PrimitiveKind kind)
{
    return kTypes[static_cast<size_t>(kind)].second;
}

std::optional<PrimitiveKind> kindFromKeyword(std::string_view keyword)
{
    for (const auto& [kind, info] : kTypes) {
        if (info.keyword == keyword)
            return kind;
    }
    return std::nullopt;
}

} // namespace bitwise
