#include "printer.hpp"
#include "codec.hpp"
#include <cctype>
#include <iomanip>
#include <sstream>

namespace bitwise {

namespace {

std::string describe(const LayoutNode& node)
{
    switch (node.kind) {
    case NodeKind::Primitive:
        return std::string(typeInfo(node.type).keyword);
    case NodeKind::Bitfield:
        return std::string(typeInfo(node.type).keyword) + ":" + std::to_string(node.bitWidth);
    case NodeKind::Record:
        return node.isUnion ? "union" : "struct";
    case NodeKind::Array:
        return describe(node.children.front()) + "[" + std::to_string(node.count) + "]";
    }
    return "?";
}

void printRow(std::ostream& out, const LayoutNode& node, int depth, bool relative)
{
    std::ostringstream offset;
    offset << (relative ? "+" : "") << "0x" << std::hex << std::uppercase << std::setw(4)
           << std::setfill('0') << node.byteOffset;

    out << std::left << std::setw(9) << offset.str() << std::right
        << ' ' << node.bitOffset
        << ' ' << std::setw(6) << node.bitWidth << "  "
        << std::left << std::setw(14) << describe(node) << std::right
        << std::string(depth * 2, ' ') << (node.name.empty() ? "(root)" : node.name) << '\n';
}

void printTree(std::ostream& out, const LayoutNode& node, int depth, bool relative)
{
    printRow(out, node, depth, relative);
    if (node.kind == NodeKind::Record) {
        for (const auto& child : node.children)
            printTree(out, child, depth + 1, relative);
    } else if (node.kind == NodeKind::Array && node.children.front().kind == NodeKind::Record) {
        // element template, offsets relative to each element
        for (const auto& child : node.children.front().children)
            printTree(out, child, depth + 1, true);
    }
}

std::string quote(const std::string& text)
{
    std::ostringstream oss;
    oss << '"';
    for (unsigned char c : text) {
        if (c == '"' || c == '\\')
            oss << '\\' << c;
        else if (std::isprint(c))
            oss << c;
        else
            oss << "\\x" << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(c) << std::dec;
    }
    oss << '"';
    return oss.str();
}

std::string formatNumber(std::int64_t value)
{
    std::ostringstream oss;
    oss << value;
    if (value >= 0)
        oss << " (0x" << std::hex << std::uppercase << value << ")";
    return oss.str();
}

bool holdsRecords(const Element& element)
{
    return element.kind() == NodeKind::Record
        || (element.kind() == NodeKind::Array && element.layout().children.front().kind == NodeKind::Record);
}

void printElement(std::ostream& out, const Element& element, const std::string& label, int depth)
{
    const std::string indent(depth * 2, ' ');

    if (element.kind() == NodeKind::Record) {
        out << indent << label << " {\n";
        for (const auto& name : element.fieldNames())
            printElement(out, element.field(name), name, depth + 1);
        out << indent << "}\n";
    } else if (holdsRecords(element)) {
        out << indent << label << "[" << element.count() << "]\n";
        for (size_t i = 0; i < element.count(); ++i)
            printElement(out, element[i], "[" + std::to_string(i) + "]", depth + 1);
    } else {
        out << indent << label << " = " << formatValue(element) << '\n';
    }
}

} // namespace

void printTokens(std::ostream& out, const std::vector<Token>& tokens)
{
    for (const auto& token : tokens) {
        out << "Token(Type: " << static_cast<int>(token.type)
            << ", Value: \"" << token.value << "\", Line: " << token.line << ")\n";
    }
}

void printLayout(std::ostream& out, const ResolvedLayout& layout)
{
    out << "offset    bit   bits  type          name\n";
    printTree(out, layout.root(), 0, false);
    out << "total " << layout.size() << " bytes\n";
}

std::string formatValue(const Element& element)
{
    if (element.kind() == NodeKind::Array) {
        const auto& info = typeInfo(element.layout().children.front().type);
        const bool wideBcd = info.category == Category::Bcd && element.count() > codec::maxBcdBytes;
        if (wideBcd || (info.category != Category::Char && info.category != Category::Bcd)) {
            std::string list = "[";
            for (size_t i = 0; i < element.count(); ++i) {
                if (i > 0) list += ", ";
                list += std::to_string(element[i].asInt());
            }
            return list + "]";
        }
    }

    const Value value = element.value();
    if (const auto* text = std::get_if<std::string>(&value))
        return quote(*text);
    return formatNumber(std::get<std::int64_t>(value));
}

void printValues(std::ostream& out, const Element& element)
{
    if (element.kind() == NodeKind::Record && element.name().empty()) {
        for (const auto& name : element.fieldNames())
            printElement(out, element.field(name), name, 0);
        return;
    }
    printElement(out, element, element.name(), 0);
}

} // namespace bitwise
