#include "element.hpp"
#include "codec.hpp"
#include "errors.hpp"
#include <charconv>

namespace bitwise {

namespace {

const char* kindName(NodeKind kind)
{
    switch (kind) {
        case NodeKind::Primitive: return "field";
        case NodeKind::Bitfield:  return "bitfield";
        case NodeKind::Record:    return "struct";
        case NodeKind::Array:     return "array";
    }
    return "element";
}

} // namespace

size_t Element::address() const
{
    if (node_->kind == NodeKind::Bitfield)
        return frame_ + node_->byteOffset * 8; // bitOffset is inside the group word
    return frame_ + node_->byteOffset * 8 + node_->bitOffset;
}

const LayoutNode& Element::elementLayout() const
{
    return node_->children.front();
}

bool Element::isBitLevel() const
{
    return node_->kind == NodeKind::Bitfield || address() % 8 != 0 || node_->bitWidth % 8 != 0;
}

void Element::mismatch(const std::string& what) const
{
    throw TypeMismatchError("Cannot " + what + " on " + kindName(node_->kind) + " '" + node_->name + "'");
}

// Range check for a single scalar write, without touching the store.
void Element::check(std::int64_t value) const
{
    if (node_->kind == NodeKind::Bitfield) {
        codec::checkBits(value, static_cast<unsigned>(node_->bitWidth));
        return;
    }
    const auto& info = typeInfo(node_->type);
    switch (info.category) {
        case Category::Bit:     codec::checkBits(value, 1); break;
        case Category::Integer: codec::checkInteger(value, info.bits, info.isSigned); break;
        case Category::Char:    codec::checkInteger(value, 8, false); break;
        case Category::Bcd:     codec::checkBcd(value, 1); break;
    }
}

Element Element::field(std::string_view name) const
{
    if (node_->kind != NodeKind::Record)
        mismatch("look up '" + std::string(name) + "'");

    const LayoutNode* child = node_->member(name);
    if (!child) {
        throw TypeMismatchError("No attribute " + std::string(name) + " in struct "
            + (node_->name.empty() ? "(root)" : node_->name));
    }
    return Element(*store_, *child, frame_);
}

bool Element::contains(std::string_view name) const
{
    return node_->kind == NodeKind::Record && node_->member(name) != nullptr;
}

std::vector<std::string> Element::fieldNames() const
{
    if (node_->kind != NodeKind::Record)
        mismatch("list fields");

    std::vector<std::string> names;
    names.reserve(node_->children.size());
    for (const auto& child : node_->children)
        names.push_back(child.name);
    return names;
}

Element Element::operator[](size_t index) const
{
    if (node_->kind != NodeKind::Array)
        mismatch("index");
    if (index >= node_->count) {
        throw OutOfBoundsError("Index " + std::to_string(index) + " is out of range for array '"
            + node_->name + "' of " + std::to_string(node_->count));
    }
    return Element(*store_, elementLayout(), address() + index * node_->stride);
}

size_t Element::count() const
{
    if (node_->kind != NodeKind::Array)
        mismatch("count elements");
    return node_->count;
}

Element Element::path(std::string_view path) const
{
    Element current = *this;
    size_t i = 0;
    while (i < path.size()) {
        if (path[i] == '.') {
            ++i;
        } else if (path[i] == '[') {
            const size_t close = path.find(']', i);
            if (close == std::string_view::npos)
                throw TypeMismatchError("Unterminated index in path '" + std::string(path) + "'");
            const std::string_view digits = path.substr(i + 1, close - i - 1);
            size_t index = 0;
            const auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), index);
            if (ec != std::errc() || ptr != digits.data() + digits.size() || digits.empty())
                throw TypeMismatchError("Invalid index '" + std::string(digits) + "' in path '" + std::string(path) + "'");
            current = current[index];
            i = close + 1;
        } else {
            const size_t end = path.find_first_of(".[", i);
            const std::string_view name = path.substr(i, end == std::string_view::npos ? std::string_view::npos : end - i);
            current = current.field(name);
            i = end == std::string_view::npos ? path.size() : end;
        }
    }
    return current;
}

Value Element::value() const
{
    switch (node_->kind) {
    case NodeKind::Bitfield: {
        const auto& info = typeInfo(node_->type);
        const auto group = store_->getRaw(offset(), info.bytes());
        const auto word = static_cast<std::uint64_t>(codec::decodeInteger(group, false, info.littleEndian));
        return static_cast<std::int64_t>(codec::extractBits(word, info.bits, node_->bitOffset, static_cast<unsigned>(node_->bitWidth)));
    }
    case NodeKind::Primitive: {
        const auto& info = typeInfo(node_->type);
        switch (info.category) {
        case Category::Bit: {
            const size_t bit = address();
            return static_cast<std::int64_t>(codec::decodeBit(store_->at(bit / 8), static_cast<unsigned>(bit % 8), info.littleEndian));
        }
        case Category::Integer:
            return codec::decodeInteger(store_->getRaw(offset(), info.bytes()), info.isSigned, info.littleEndian);
        case Category::Char:
            return codec::decodeChars(store_->getRaw(offset(), 1));
        case Category::Bcd:
            return codec::decodeBcd(store_->getRaw(offset(), 1), info.littleEndian);
        }
        break;
    }
    case NodeKind::Array: {
        const auto& element = elementLayout();
        if (element.kind == NodeKind::Primitive) {
            const auto& info = typeInfo(element.type);
            if (info.category == Category::Char)
                return codec::decodeChars(store_->getRaw(offset(), node_->count));
            if (info.category == Category::Bcd)
                return codec::decodeBcd(store_->getRaw(offset(), node_->count), info.littleEndian);
        }
        break;
    }
    case NodeKind::Record:
        break;
    }
    mismatch("read a value");
}

std::int64_t Element::asInt() const
{
    const Value v = value();
    if (const auto* number = std::get_if<std::int64_t>(&v))
        return *number;
    const auto& text = std::get<std::string>(v);
    if (text.size() == 1)
        return static_cast<uint8_t>(text[0]);
    mismatch("read an integer");
}

std::string Element::asString() const
{
    const Value v = value();
    if (const auto* text = std::get_if<std::string>(&v))
        return *text;
    return std::to_string(std::get<std::int64_t>(v));
}

void Element::assign(std::int64_t value)
{
    switch (node_->kind) {
    case NodeKind::Bitfield: {
        const auto& info = typeInfo(node_->type);
        const auto group = store_->getRaw(offset(), info.bytes());
        const auto word = static_cast<std::uint64_t>(codec::decodeInteger(group, false, info.littleEndian));
        const auto updated = codec::insertBits(word, info.bits, node_->bitOffset, static_cast<unsigned>(node_->bitWidth), value);
        store_->setRaw(offset(), codec::encodeInteger(static_cast<std::int64_t>(updated), info.bits, false, info.littleEndian));
        return;
    }
    case NodeKind::Primitive: {
        const auto& info = typeInfo(node_->type);
        switch (info.category) {
        case Category::Bit: {
            const size_t bit = address();
            const uint8_t updated = codec::encodeBit(store_->at(bit / 8), static_cast<unsigned>(bit % 8), info.littleEndian, value);
            store_->setRaw(bit / 8, std::span<const uint8_t>(&updated, 1));
            return;
        }
        case Category::Integer:
            store_->setRaw(offset(), codec::encodeInteger(value, info.bits, info.isSigned, info.littleEndian));
            return;
        case Category::Char:
            store_->setRaw(offset(), codec::encodeInteger(value, 8, false, false));
            return;
        case Category::Bcd:
            store_->setRaw(offset(), codec::encodeBcd(value, 1, info.littleEndian));
            return;
        }
        break;
    }
    case NodeKind::Array: {
        const auto& element = elementLayout();
        if (element.kind == NodeKind::Primitive && typeInfo(element.type).category == Category::Bcd) {
            store_->setRaw(offset(), codec::encodeBcd(value, node_->count, typeInfo(element.type).littleEndian));
            return;
        }
        break;
    }
    case NodeKind::Record:
        break;
    }
    mismatch("assign an integer");
}

void Element::assign(std::string_view value)
{
    if (node_->kind == NodeKind::Primitive && typeInfo(node_->type).category == Category::Char) {
        store_->setRaw(offset(), codec::encodeChars(value, 1));
        return;
    }
    if (node_->kind == NodeKind::Array && elementLayout().kind == NodeKind::Primitive
        && typeInfo(elementLayout().type).category == Category::Char) {
        store_->setRaw(offset(), codec::encodeChars(value, node_->count));
        return;
    }
    mismatch("assign a string");
}

void Element::assign(std::string_view value, char pad)
{
    if (node_->kind == NodeKind::Array && elementLayout().kind == NodeKind::Primitive
        && typeInfo(elementLayout().type).category == Category::Char) {
        store_->setRaw(offset(), codec::encodeChars(value, node_->count, static_cast<uint8_t>(pad)));
        return;
    }
    mismatch("assign a padded string");
}

void Element::assign(const std::vector<std::int64_t>& values)
{
    if (node_->kind != NodeKind::Array || elementLayout().kind != NodeKind::Primitive)
        mismatch("assign a list of values");
    if (values.size() != node_->count) {
        throw EncodingError("Array '" + node_->name + "' holds " + std::to_string(node_->count)
            + " elements, not " + std::to_string(values.size()));
    }

    // Validate everything before the first write.
    for (size_t i = 0; i < values.size(); ++i)
        (*this)[i].check(values[i]);
    for (size_t i = 0; i < values.size(); ++i)
        (*this)[i].assign(values[i]);
}

void Element::assign(const Value& value)
{
    if (const auto* number = std::get_if<std::int64_t>(&value))
        assign(*number);
    else
        assign(std::get<std::string>(value));
}

size_t Element::maskedByte(const char* what) const
{
    if (node_->kind != NodeKind::Primitive || isBitLevel() || node_->bitWidth != 8)
        mismatch(what);
    return offset();
}

uint8_t Element::getBits(uint8_t mask) const
{
    return static_cast<uint8_t>(store_->at(maskedByte("read masked bits")) & mask);
}

void Element::setBits(uint8_t mask)
{
    const size_t at = maskedByte("set masked bits");
    const uint8_t updated = store_->at(at) | mask;
    store_->setRaw(at, std::span<const uint8_t>(&updated, 1));
}

void Element::clearBits(uint8_t mask)
{
    const size_t at = maskedByte("clear masked bits");
    const uint8_t updated = store_->at(at) & static_cast<uint8_t>(~mask);
    store_->setRaw(at, std::span<const uint8_t>(&updated, 1));
}

std::vector<uint8_t> Element::getRaw() const
{
    if (isBitLevel())
        mismatch("read raw bytes");
    return store_->getRaw(offset(), size());
}

void Element::setRaw(std::span<const uint8_t> bytes)
{
    if (isBitLevel())
        mismatch("write raw bytes");
    if (bytes.size() != size()) {
        throw EncodingError("Raw data for '" + node_->name + "' must be " + std::to_string(size())
            + " bytes, not " + std::to_string(bytes.size()));
    }
    store_->setRaw(offset(), bytes);
}

void Element::fill(uint8_t pattern)
{
    if (isBitLevel())
        mismatch("fill");
    store_->fill(offset(), size(), pattern);
}

Element bind(const ResolvedLayout& layout, BackingStore& store)
{
    return Element(store, layout.root());
}

} // namespace bitwise
