#pragma once
#include <cstddef>
#include <memory>
#include <string>
#include <vector>
#include "types.hpp"

namespace bitwise {

enum class DirectiveKind
{
    SEEK_TO,      // absolute byte address
    SEEK,         // relative skip in bytes
    PRINT_OFFSET, // log the cursor, no placement effect
};

class Visitor; // Forward declaration
struct PrimitiveNode;
struct BitfieldGroupNode;
struct RecordNode;
struct ArrayNode;
struct DirectiveNode;

struct Node
{
    int line = 0;
    virtual void accept(Visitor &v) const = 0;
    virtual std::unique_ptr<Node> clone() const = 0;
    virtual ~Node() = default;
};

class Visitor
{
public:
    virtual void visit(const PrimitiveNode &node) = 0;
    virtual void visit(const BitfieldGroupNode &node) = 0;
    virtual void visit(const RecordNode &node) = 0;
    virtual void visit(const ArrayNode &node) = 0;
    virtual void visit(const DirectiveNode &node) = 0;
    virtual ~Visitor() = default;
};

struct PrimitiveNode : Node
{
    PrimitiveKind kind;
    std::string name;
    explicit PrimitiveNode(PrimitiveKind kind, std::string name) : kind(kind), name(std::move(name)) {}
    void accept(Visitor &v) const override { v.visit(*this); }
    std::unique_ptr<Node> clone() const override { return std::make_unique<PrimitiveNode>(*this); }
};

struct BitfieldMember
{
    std::string name;
    unsigned width;
    int line;
};

// name:width members packed MSB first into one base integer
struct BitfieldGroupNode : Node
{
    PrimitiveKind base;
    std::vector<BitfieldMember> members;
    explicit BitfieldGroupNode(PrimitiveKind base, std::vector<BitfieldMember> members) : base(base), members(std::move(members)) {}
    void accept(Visitor &v) const override { v.visit(*this); }
    std::unique_ptr<Node> clone() const override { return std::make_unique<BitfieldGroupNode>(*this); }
};

struct RecordNode : Node
{
    std::string name;
    bool isUnion = false;
    std::vector<std::unique_ptr<Node>> members;
    explicit RecordNode(std::string name, std::vector<std::unique_ptr<Node>> members = {}, bool isUnion = false) : name(std::move(name)), isUnion(isUnion), members(std::move(members)) {}
    void accept(Visitor &v) const override { v.visit(*this); }
    std::unique_ptr<Node> clone() const override
    {
        std::vector<std::unique_ptr<Node>> copies;
        copies.reserve(members.size());
        for (const auto& member : members)
            copies.push_back(member->clone());
        auto copy = std::make_unique<RecordNode>(name, std::move(copies), isUnion);
        copy->line = line;
        return copy;
    }
};

struct ArrayNode : Node
{
    std::string name;
    size_t count;
    std::unique_ptr<Node> element; // PrimitiveNode or RecordNode
    explicit ArrayNode(std::string name, size_t count, std::unique_ptr<Node> element) : name(std::move(name)), count(count), element(std::move(element)) {}
    void accept(Visitor &v) const override { v.visit(*this); }
    std::unique_ptr<Node> clone() const override
    {
        auto copy = std::make_unique<ArrayNode>(name, count, element->clone());
        copy->line = line;
        return copy;
    }
};

struct DirectiveNode : Node
{
    DirectiveKind kind;
    size_t value = 0;
    std::string label;
    explicit DirectiveNode(DirectiveKind kind, size_t value, std::string label = "") : kind(kind), value(value), label(std::move(label)) {}
    void accept(Visitor &v) const override { v.visit(*this); }
    std::unique_ptr<Node> clone() const override { return std::make_unique<DirectiveNode>(*this); }
};

} // namespace bitwise
