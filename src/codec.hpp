#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

// Pure conversions between raw bytes and semantic values. Nothing here touches
// a BackingStore; encoders validate fully and throw EncodingError before
// producing any output.
namespace bitwise::codec {

// --- Integers (8/16/24/32-bit, two's complement) ---
std::int64_t decodeInteger(std::span<const uint8_t> bytes, bool isSigned, bool littleEndian);
void checkInteger(std::int64_t value, unsigned bits, bool isSigned);
std::vector<uint8_t> encodeInteger(std::int64_t value, unsigned bits, bool isSigned, bool littleEndian);

// --- Binary coded decimal, two digits per byte, tens in the high nibble ---
// Wider runs than maxBcdBytes (18 digits) are rejected as a whole.
constexpr size_t maxBcdBytes = 9;
std::int64_t decodeBcd(std::span<const uint8_t> bytes, bool littleEndian);
void checkBcd(std::int64_t value, size_t bytes);
std::vector<uint8_t> encodeBcd(std::int64_t value, size_t bytes, bool littleEndian);

// --- Fixed length character arrays ---
std::string decodeChars(std::span<const uint8_t> bytes);
std::vector<uint8_t> encodeChars(std::string_view value, size_t length, std::optional<uint8_t> pad = std::nullopt);

// --- Bitfields ---
// offset counts from the most significant bit of a wordBits wide integer.
std::uint64_t extractBits(std::uint64_t word, unsigned wordBits, unsigned offset, unsigned width);
void checkBits(std::int64_t value, unsigned width);
std::uint64_t insertBits(std::uint64_t word, unsigned wordBits, unsigned offset, unsigned width, std::int64_t value);

// --- Single bits; index 0 is the MSB unless lsbFirst ---
bool decodeBit(uint8_t byte, unsigned index, bool lsbFirst);
uint8_t encodeBit(uint8_t byte, unsigned index, bool lsbFirst, std::int64_t value);

} // namespace bitwise::codec
