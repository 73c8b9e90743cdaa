#include "backing_store.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>

namespace bitwise {

BackingStore BackingStore::load(std::vector<uint8_t> bytes)
{
    BackingStore store;
    store.data = std::move(bytes);
    return store;
}

BackingStore BackingStore::load(std::span<const uint8_t> bytes)
{
    return load(std::vector<uint8_t>(bytes.begin(), bytes.end()));
}

void BackingStore::checkRange(size_t offset, size_t length) const
{
    if (offset > data.size() || length > data.size() - offset) {
        std::ostringstream oss;
        oss << "Byte range [0x" << std::hex << offset << ", 0x" << offset + length
            << ") is outside the " << std::dec << data.size() << " byte image";
        throw OutOfBoundsError(oss.str());
    }
}

uint8_t BackingStore::at(size_t offset) const
{
    checkRange(offset, 1);
    return data[offset];
}

std::vector<uint8_t> BackingStore::getRaw(size_t offset, size_t length) const
{
    checkRange(offset, length);
    return std::vector<uint8_t>(data.begin() + offset, data.begin() + offset + length);
}

void BackingStore::setRaw(size_t offset, std::span<const uint8_t> bytes)
{
    checkRange(offset, bytes.size());
    std::copy(bytes.begin(), bytes.end(), data.begin() + offset);
}

void BackingStore::fill(size_t offset, size_t length, uint8_t pattern)
{
    checkRange(offset, length);
    std::fill_n(data.begin() + offset, length, pattern);
}

std::string BackingStore::hexdump(size_t start, size_t end) const
{
    end = std::min(end, data.size());
    std::ostringstream oss;
    oss << std::hex << std::uppercase << std::setfill('0');
    for (size_t row = start; row < end; row += 16) {
        oss << std::setw(4) << row << ": ";
        std::string ascii;
        for (size_t i = row; i < row + 16; ++i) {
            if (i < end) {
                oss << std::setw(2) << static_cast<int>(data[i]) << ' ';
                ascii.push_back(std::isprint(data[i]) ? static_cast<char>(data[i]) : '.');
            } else {
                oss << "   ";
            }
        }
        oss << "  " << ascii << '\n';
    }
    return oss.str();
}

} // namespace bitwise
