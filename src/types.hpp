#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace bitwise {

enum class PrimitiveKind
{
    BIT,
    LBIT,
    UNSIGNED_8,
    UNSIGNED_16,
    UNSIGNED_16_LE,
    UNSIGNED_24,
    UNSIGNED_24_LE,
    UNSIGNED_32,
    UNSIGNED_32_LE,
    SIGNED_8,
    SIGNED_16,
    SIGNED_16_LE,
    SIGNED_24,
    SIGNED_24_LE,
    SIGNED_32,
    SIGNED_32_LE,
    CHAR,
    BCD_BIG,
    BCD_LITTLE,
};

enum class Category
{
    Bit,
    Integer,
    Char,
    Bcd,
};

struct TypeInfo
{
    std::string_view keyword;
    Category category;
    unsigned bits;
    bool isSigned;
    bool littleEndian;

    constexpr size_t bytes() const { return bits / 8; }
};

const TypeInfo& typeInfo(PrimitiveKind kind);
std::optional<PrimitiveKind> kindFromKeyword(std::string_view keyword);

// Unsigned integer kinds are the only valid bitfield bases.
inline bool isBitfieldBase(PrimitiveKind kind)
{
    const auto& info = typeInfo(kind);
    return info.category == Category::Integer && !info.isSigned;
}

} // namespace bitwise
