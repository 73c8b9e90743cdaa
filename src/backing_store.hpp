#pragma once
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace bitwise {

/**
 * @brief Fixed-length mutable byte image of a device's memory.
 *
 * The store knows nothing about schemas. Its length is set at construction
 * and never changes; every access past the end raises OutOfBoundsError.
 */
class BackingStore
{
    std::vector<uint8_t> data;

    void checkRange(size_t offset, size_t length) const;

public:
    explicit BackingStore(size_t size = 0, uint8_t pattern = 0x00) : data(size, pattern) {}

    static BackingStore load(std::vector<uint8_t> bytes);
    static BackingStore load(std::span<const uint8_t> bytes);

    std::vector<uint8_t> dump() const { return data; }
    size_t size() const { return data.size(); }

    uint8_t at(size_t offset) const;
    std::vector<uint8_t> getRaw(size_t offset, size_t length) const;
    void setRaw(size_t offset, std::span<const uint8_t> bytes);
    void fill(size_t offset, size_t length, uint8_t pattern);

    // Classic 16 bytes per row hex + ascii listing of [start, end).
    std::string hexdump(size_t start = 0, size_t end = SIZE_MAX) const;
};

} // namespace bitwise
