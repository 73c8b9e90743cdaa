#pragma once
#include "ast.hpp"
#include "parser.hpp"
#include <cstddef>
#include <functional>
#include <map>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace bitwise {

enum class NodeKind
{
    Primitive,  // byte aligned value, or a single bit inside a bit array
    Bitfield,   // member of a bitfield group
    Record,     // struct or union
    Array,
};

/**
 * @brief Placement of one field.
 *
 * Offsets are absolute, except inside an array element template where they
 * are relative to the start of the element. bitOffset is the bit index inside
 * byteOffset for single bits, and the distance from the most significant bit
 * of the group word for bitfields. bitWidth is the full extent of the node.
 */
struct LayoutNode
{
    NodeKind kind = NodeKind::Primitive;
    std::string name;
    int line = 0;
    size_t byteOffset = 0;
    unsigned bitOffset = 0;
    size_t bitWidth = 0;
    PrimitiveKind type = PrimitiveKind::UNSIGNED_8; // bitfields: the group's base type
    bool isUnion = false;
    size_t count = 0;  // arrays
    size_t stride = 0; // arrays, in bits
    std::vector<LayoutNode> children; // record members, or the single array element template
    std::map<std::string, size_t, std::less<>> index;

    size_t sizeBytes() const { return (bitWidth + 7) / 8; }
    const LayoutNode* member(std::string_view name) const;

    bool operator==(const LayoutNode& other) const;
};

struct ResolveOptions
{
    // Stated image size; a layout reaching past it is a LayoutError.
    std::optional<size_t> expectedSize;
    // Diagnostics sink ([debug] / [error] lines). Nothing is written when null.
    std::ostream* log = nullptr;
    bool verbose = false;
};

class ResolvedLayout
{
    LayoutNode root_;

public:
    explicit ResolvedLayout(LayoutNode root) : root_(std::move(root)) {}

    const LayoutNode& root() const { return root_; }
    size_t size() const { return root_.sizeBytes(); }

    bool operator==(const ResolvedLayout& other) const { return root_ == other.root_; }
};

class LayoutVisitor : public Visitor
{
    const ResolveOptions& options;

    size_t cursor = 0;    // bits from the start of the current frame
    size_t highWater = 0; // furthest bit reached inside the current record
    int repeatDepth = 0;  // > 0 while resolving an array element template
    size_t frameBase = 0; // absolute bit address of the first element while resolving a template
    std::vector<LayoutNode>* out = nullptr;
    std::vector<std::string> scope;

    std::string where(const std::string& name = "") const;
    void advance(size_t bits);
    void requireAligned(const std::string& name, const char* what) const;
    void debug(const std::string& message) const;
    void error(const std::string& message) const;
    void buildIndex(LayoutNode& record) const;

public:
    explicit LayoutVisitor(const ResolveOptions& options) : options(options) {}

    LayoutNode resolveRecord(const RecordNode &node);

    void visit(const PrimitiveNode &node) override;
    void visit(const BitfieldGroupNode &node) override;
    void visit(const RecordNode &node) override;
    void visit(const ArrayNode &node) override;
    void visit(const DirectiveNode &node) override;
};

// Pure and deterministic; throws LayoutError and never returns a partial layout.
ResolvedLayout resolve(const CompiledSchema& schema, const ResolveOptions& options = {});

} // namespace bitwise
