#include "codec.hpp"
#include "errors.hpp"

namespace bitwise::codec {

namespace {

constexpr std::uint64_t maskOf(unsigned width)
{
    return width >= 64 ? ~std::uint64_t{0} : (std::uint64_t{1} << width) - 1;
}

} // namespace

std::int64_t decodeInteger(std::span<const uint8_t> bytes, bool isSigned, bool littleEndian)
{
    std::uint64_t raw = 0;
    const size_t n = bytes.size();
    for (size_t i = 0; i < n; ++i) {
        const uint8_t b = littleEndian ? bytes[n - 1 - i] : bytes[i];
        raw = (raw << 8) | b;
    }

    const unsigned bits = static_cast<unsigned>(n * 8);
    if (isSigned && bits > 0 && (raw >> (bits - 1)) & 1)
        return static_cast<std::int64_t>(raw) - static_cast<std::int64_t>(std::uint64_t{1} << bits);
    return static_cast<std::int64_t>(raw);
}

void checkInteger(std::int64_t value, unsigned bits, bool isSigned)
{
    std::int64_t lo = 0;
    std::int64_t hi = static_cast<std::int64_t>(maskOf(bits));
    if (isSigned) {
        lo = -(std::int64_t{1} << (bits - 1));
        hi = (std::int64_t{1} << (bits - 1)) - 1;
    }
    if (value < lo || value > hi) {
        throw EncodingError("Value " + std::to_string(value) + " does not fit a "
            + (isSigned ? "signed " : "unsigned ") + std::to_string(bits) + "-bit field ["
            + std::to_string(lo) + ", " + std::to_string(hi) + "]");
    }
}

std::vector<uint8_t> encodeInteger(std::int64_t value, unsigned bits, bool isSigned, bool littleEndian)
{
    checkInteger(value, bits, isSigned);

    const size_t n = bits / 8;
    const std::uint64_t raw = static_cast<std::uint64_t>(value) & maskOf(bits);
    std::vector<uint8_t> out(n);
    for (size_t i = 0; i < n; ++i) {
        const uint8_t b = static_cast<uint8_t>((raw >> (8 * i)) & 0xFF);
        out[littleEndian ? i : n - 1 - i] = b;
    }
    return out;
}

std::int64_t decodeBcd(std::span<const uint8_t> bytes, bool littleEndian)
{
    const size_t n = bytes.size();
    if (n > maxBcdBytes)
        throw EncodingError(std::to_string(n * 2) + " BCD digits do not fit a 64-bit integer");

    std::int64_t value = 0;
    for (size_t i = 0; i < n; ++i) {
        const uint8_t b = littleEndian ? bytes[n - 1 - i] : bytes[i];
        const int tens = (b & 0xF0) >> 4;
        const int ones = b & 0x0F;
        value = (value * 100) + (tens * 10) + ones;
    }
    return value;
}

void checkBcd(std::int64_t value, size_t bytes)
{
    if (value < 0)
        throw EncodingError("BCD fields cannot hold negative value " + std::to_string(value));
    if (bytes > maxBcdBytes)
        throw EncodingError(std::to_string(bytes * 2) + " BCD digits do not fit a 64-bit integer");

    std::int64_t capacity = 1;
    for (size_t i = 0; i < bytes; ++i)
        capacity *= 100;
    if (value >= capacity) {
        throw EncodingError("Value " + std::to_string(value) + " needs more than "
            + std::to_string(bytes * 2) + " BCD digits");
    }
}

std::vector<uint8_t> encodeBcd(std::int64_t value, size_t bytes, bool littleEndian)
{
    checkBcd(value, bytes);

    std::vector<uint8_t> out(bytes);
    for (size_t i = 0; i < bytes; ++i) {
        const int pair = static_cast<int>(value % 100);
        value /= 100;
        const uint8_t b = static_cast<uint8_t>(((pair / 10) << 4) | (pair % 10));
        // i counts from the least significant pair
        out[littleEndian ? i : bytes - 1 - i] = b;
    }
    return out;
}

std::string decodeChars(std::span<const uint8_t> bytes)
{
    return std::string(bytes.begin(), bytes.end());
}

std::vector<uint8_t> encodeChars(std::string_view value, size_t length, std::optional<uint8_t> pad)
{
    if (value.size() > length || (value.size() < length && !pad)) {
        throw EncodingError("String expects exactly " + std::to_string(length)
            + " characters, not " + std::to_string(value.size()));
    }

    std::vector<uint8_t> out(value.begin(), value.end());
    out.resize(length, pad.value_or(0x00));
    return out;
}

std::uint64_t extractBits(std::uint64_t word, unsigned wordBits, unsigned offset, unsigned width)
{
    const unsigned shift = wordBits - offset - width;
    return (word >> shift) & maskOf(width);
}

void checkBits(std::int64_t value, unsigned width)
{
    if (value < 0 || static_cast<std::uint64_t>(value) > maskOf(width)) {
        throw EncodingError("Value " + std::to_string(value) + " does not fit a "
            + std::to_string(width) + "-bit field");
    }
}

std::uint64_t insertBits(std::uint64_t word, unsigned wordBits, unsigned offset, unsigned width, std::int64_t value)
{
    checkBits(value, width);

    const unsigned shift = wordBits - offset - width;
    const std::uint64_t mask = maskOf(width) << shift;
    return (word & ~mask) | ((static_cast<std::uint64_t>(value) << shift) & mask);
}

bool decodeBit(uint8_t byte, unsigned index, bool lsbFirst)
{
    const unsigned shift = lsbFirst ? index : 7 - index;
    return (byte >> shift) & 1;
}

uint8_t encodeBit(uint8_t byte, unsigned index, bool lsbFirst, std::int64_t value)
{
    checkBits(value, 1);

    const unsigned shift = lsbFirst ? index : 7 - index;
    const uint8_t mask = static_cast<uint8_t>(1u << shift);
    return static_cast<uint8_t>(value ? (byte | mask) : (byte & ~mask));
}

} // namespace bitwise::codec
