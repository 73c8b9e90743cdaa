#pragma once
#include "backing_store.hpp"
#include "layout.hpp"
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace bitwise {

using Value = std::variant<std::int64_t, std::string>;

/**
 * @brief Non-owning view of one field over a BackingStore.
 *
 * An Element is a (store, layout node, frame) triple and holds no copy of the
 * data: every read decodes the store's current bytes and every write goes
 * straight to the store, so all elements over the same bytes see each other's
 * writes. Elements must not outlive the store or the layout they came from.
 *
 * Operations are only meaningful for some kinds; calling one on the wrong
 * kind throws TypeMismatchError.
 */
class Element
{
    BackingStore* store_;
    const LayoutNode* node_;
    size_t frame_; // bit address of the enclosing array element (0 outside arrays)

    size_t address() const;
    const LayoutNode& elementLayout() const;
    bool isBitLevel() const;
    void check(std::int64_t value) const;
    size_t maskedByte(const char* what) const;
    [[noreturn]] void mismatch(const std::string& what) const;

public:
    Element(BackingStore& store, const LayoutNode& node, size_t frameBits = 0) : store_(&store), node_(&node), frame_(frameBits) {}

    NodeKind kind() const { return node_->kind; }
    const std::string& name() const { return node_->name; }
    const LayoutNode& layout() const { return *node_; }
    size_t offset() const { return address() / 8; }
    size_t sizeBits() const { return node_->bitWidth; }
    size_t size() const { return node_->sizeBytes(); }

    // --- Records ---
    Element field(std::string_view name) const;
    bool contains(std::string_view name) const;
    std::vector<std::string> fieldNames() const;

    // --- Arrays ---
    Element operator[](size_t index) const;
    size_t count() const;

    // ".channels[3].name" style lookup starting at this element
    Element path(std::string_view path) const;

    // --- Values: primitives, bitfields, char and BCD arrays ---
    Value value() const;
    std::int64_t asInt() const;
    std::string asString() const;

    void assign(std::int64_t value);
    void assign(int value) { assign(static_cast<std::int64_t>(value)); }
    void assign(std::string_view value);
    void assign(const char* value) { assign(std::string_view(value)); }
    void assign(const std::string& value) { assign(std::string_view(value)); }
    void assign(std::string_view value, char pad);
    void assign(const std::vector<std::int64_t>& values);
    void assign(const Value& value);

    // --- Flag bits on a single byte field (bcd digits carrying status bits) ---
    uint8_t getBits(uint8_t mask) const;
    void setBits(uint8_t mask);
    void clearBits(uint8_t mask);

    // --- Raw bytes, bypassing the codecs ---
    std::vector<uint8_t> getRaw() const;
    void setRaw(std::span<const uint8_t> bytes);
    void fill(uint8_t pattern);
};

Element bind(const ResolvedLayout& layout, BackingStore& store);

} // namespace bitwise
