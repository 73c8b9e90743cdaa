#include "layout.hpp"
#include "errors.hpp"
#include <algorithm>
#include <iomanip>
#include <limits>
#include <sstream>

namespace bitwise {

namespace {

// Largest bit extent whose byte size still fits a size_t.
constexpr size_t maxExtentBits = std::numeric_limits<size_t>::max() - 7;

} // namespace

const LayoutNode* LayoutNode::member(std::string_view memberName) const
{
    auto it = index.find(memberName);
    if (it == index.end())
        return nullptr;
    return &children[it->second];
}

bool LayoutNode::operator==(const LayoutNode& other) const
{
    return kind == other.kind && name == other.name && line == other.line
        && byteOffset == other.byteOffset && bitOffset == other.bitOffset
        && bitWidth == other.bitWidth && type == other.type && isUnion == other.isUnion
        && count == other.count && stride == other.stride && index == other.index
        && children == other.children;
}

std::string LayoutVisitor::where(const std::string& name) const
{
    std::string path;
    for (const auto& part : scope) {
        if (part.empty()) continue;
        if (!path.empty()) path += '.';
        path += part;
    }
    if (!name.empty()) {
        if (!path.empty()) path += '.';
        path += name;
    }
    return path;
}

void LayoutVisitor::advance(size_t bits)
{
    if (bits > maxExtentBits - cursor)
        throw LayoutError(where(), "Layout extends past the addressable range");
    cursor += bits;
    highWater = std::max(highWater, cursor);
}

void LayoutVisitor::requireAligned(const std::string& name, const char* what) const
{
    if (cursor % 8 != 0) {
        std::ostringstream oss;
        oss << what << " at bit " << cursor % 8 << " of byte 0x" << std::hex << cursor / 8
            << " splits an unfinished bit group";
        throw LayoutError(where(name), oss.str());
    }
}

void LayoutVisitor::debug(const std::string& message) const
{
    if (options.log && options.verbose)
        *options.log << "[debug] " << message << '\n';
}

void LayoutVisitor::error(const std::string& message) const
{
    if (options.log)
        *options.log << "[error] " << message << '\n';
}

void LayoutVisitor::buildIndex(LayoutNode& record) const
{
    std::map<std::string, int> lines;
    for (size_t i = 0; i < record.children.size(); ++i) {
        LayoutNode& child = record.children[i];
        if (record.index.contains(child.name)) {
            std::ostringstream renamed;
            renamed << child.name << '_' << std::hex << std::setw(6) << std::setfill('0') << frameBase / 8 + child.byteOffset;
            if (record.index.contains(renamed.str())) {
                throw LayoutError(where(child.name), "Duplicate definition on line " + std::to_string(child.line)
                    + " cannot be renamed to " + renamed.str() + ", which is already defined");
            }
            error("Duplicate definition for " + where(child.name) + " on line " + std::to_string(child.line)
                + "; renaming to " + renamed.str() + " (previous definition line "
                + std::to_string(lines[child.name]) + ")");
            child.name = renamed.str();
        }
        lines[child.name] = child.line;
        record.index.emplace(child.name, i);
    }
}

void LayoutVisitor::visit(const PrimitiveNode &node)
{
    const auto& info = typeInfo(node.kind);
    requireAligned(node.name, "Field");

    LayoutNode result;
    result.kind = NodeKind::Primitive;
    result.name = node.name;
    result.line = node.line;
    result.type = node.kind;
    result.byteOffset = cursor / 8;
    result.bitWidth = info.bits;
    out->push_back(std::move(result));
    advance(info.bits);
}

void LayoutVisitor::visit(const BitfieldGroupNode &node)
{
    const auto& info = typeInfo(node.base);
    requireAligned(node.members.front().name, "Bitfield group");

    unsigned used = 0;
    for (const auto& member : node.members) {
        LayoutNode result;
        result.kind = NodeKind::Bitfield;
        result.name = member.name;
        result.line = member.line;
        result.type = node.base;
        result.byteOffset = cursor / 8;
        result.bitOffset = used;
        result.bitWidth = member.width;
        out->push_back(std::move(result));
        used += member.width;
    }
    // the group is consumed as a unit
    advance(info.bits);
}

LayoutNode LayoutVisitor::resolveRecord(const RecordNode &node)
{
    requireAligned(node.name, node.isUnion ? "Union" : "Struct");

    LayoutNode result;
    result.kind = NodeKind::Record;
    result.name = node.name;
    result.line = node.line;
    result.isUnion = node.isUnion;
    result.byteOffset = cursor / 8;

    const size_t start = cursor;
    const size_t outerHigh = highWater;
    auto* outerOut = out;
    out = &result.children;
    scope.push_back(node.name);
    highWater = cursor;

    if (node.isUnion) {
        std::optional<size_t> size;
        for (const auto& member : node.members) {
            cursor = start;
            highWater = start;
            const size_t before = result.children.size();
            member->accept(*this);
            if (result.children.size() == before)
                continue; // directives take no room
            const size_t memberSize = highWater - start;
            if (size && *size != memberSize) {
                throw LayoutError(where(result.children.back().name), "Union member is "
                    + std::to_string(memberSize) + " bits but the union is " + std::to_string(*size));
            }
            size = memberSize;
        }
        cursor = start;
        highWater = start;
        advance(size.value_or(0));
    } else {
        for (const auto& member : node.members)
            member->accept(*this);
    }

    requireAligned("", "End of record");
    result.bitWidth = highWater - start;

    buildIndex(result);

    scope.pop_back();
    out = outerOut;
    highWater = std::max(outerHigh, highWater);
    return result;
}

void LayoutVisitor::visit(const RecordNode &node)
{
    out->push_back(resolveRecord(node));
}

void LayoutVisitor::visit(const ArrayNode &node)
{
    LayoutNode result;
    result.kind = NodeKind::Array;
    result.name = node.name;
    result.line = node.line;
    result.count = node.count;

    if (const auto* primitive = dynamic_cast<const PrimitiveNode*>(node.element.get())) {
        const auto& info = typeInfo(primitive->kind);
        if (info.category != Category::Bit)
            requireAligned(node.name, "Array");

        LayoutNode element;
        element.kind = NodeKind::Primitive;
        element.name = primitive->name;
        element.line = primitive->line;
        element.type = primitive->kind;
        element.bitWidth = info.bits;
        result.stride = info.bits;
        result.children.push_back(std::move(element));
    } else {
        const auto& record = dynamic_cast<const RecordNode&>(*node.element);
        requireAligned(node.name, "Array");

        // Resolve the element once, relative to its own start.
        const size_t savedCursor = cursor;
        const size_t savedHigh = highWater;
        const size_t savedBase = frameBase;
        frameBase += cursor;
        cursor = 0;
        highWater = 0;
        repeatDepth++;
        LayoutNode element = resolveRecord(record);
        repeatDepth--;
        frameBase = savedBase;
        cursor = savedCursor;
        highWater = savedHigh;

        if (element.bitWidth == 0)
            throw LayoutError(where(node.name), "Array element has zero size");
        result.stride = element.bitWidth;
        result.children.push_back(std::move(element));
    }

    result.byteOffset = cursor / 8;
    result.bitOffset = static_cast<unsigned>(cursor % 8);
    if (result.stride > maxExtentBits / result.count)
        throw LayoutError(where(node.name), std::to_string(result.count) + " elements overflow the addressable range");
    result.bitWidth = result.count * result.stride;
    const size_t extent = result.bitWidth;
    out->push_back(std::move(result));
    advance(extent);
}

void LayoutVisitor::visit(const DirectiveNode &node)
{
    switch (node.kind) {
    case DirectiveKind::SEEK_TO: {
        requireAligned("", "#seekto");
        if (repeatDepth > 0)
            throw LayoutError(where(), "#seekto inside a repeated array element gives every element the same address");
        if (node.value > maxExtentBits / 8)
            throw LayoutError(where(), "#seekto " + std::to_string(node.value) + " is past the addressable range");
        const size_t target = node.value * 8;
        if (target < cursor)
            debug("Backward #seekto from " + std::to_string(cursor / 8) + " to " + std::to_string(node.value) + " on line " + std::to_string(node.line));
        cursor = target;
        highWater = std::max(highWater, cursor);
        break;
    }
    case DirectiveKind::SEEK:
        requireAligned("", "#seek");
        if (node.value > maxExtentBits / 8)
            throw LayoutError(where(), "#seek " + std::to_string(node.value) + " is past the addressable range");
        advance(node.value * 8);
        break;
    case DirectiveKind::PRINT_OFFSET: {
        std::ostringstream oss;
        oss << node.label << ": " << cursor / 8 << " (0x" << std::hex << std::uppercase
            << std::setw(8) << std::setfill('0') << cursor / 8 << ")";
        debug(oss.str());
        break;
    }
    }
}

ResolvedLayout resolve(const CompiledSchema& schema, const ResolveOptions& options)
{
    LayoutVisitor visitor(options);
    LayoutNode root = visitor.resolveRecord(schema.root());

    if (options.expectedSize && root.sizeBytes() > *options.expectedSize) {
        throw LayoutError("", "Layout needs " + std::to_string(root.sizeBytes())
            + " bytes but the image holds " + std::to_string(*options.expectedSize));
    }
    return ResolvedLayout(std::move(root));
}

} // namespace bitwise
