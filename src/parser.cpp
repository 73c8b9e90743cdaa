#include "parser.hpp"
#include "errors.hpp"
#include <charconv>
#include <memory>

namespace bitwise {

size_t Parser::parseNumber()
{
    const Token token = currentToken;
    consume(Type::NUMBER, "a number");

    std::string_view sv = token.value;
    int base = 10;
    if (sv.size() > 2 && sv[0] == '0' && (sv[1] == 'x' || sv[1] == 'X'))
    {
        base = 16;
        sv.remove_prefix(2);
    }

    size_t value = 0;
    const auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), value, base);
    if (ec != std::errc() || ptr != sv.data() + sv.size())
        throw SyntaxError(token.line, "Invalid numeric literal '" + std::string(token.value) + "'");
    return value;
}

size_t Parser::parseCount()
{
    const Token token = currentToken;
    if (token.type != Type::NUMBER)
        throw SyntaxError(token.line, "Array count must be an integer, found " + token.to_string());

    const size_t count = parseNumber();
    if (count == 0)
        throw SyntaxError(token.line, "Array count must be positive");
    return count;
}

std::unique_ptr<Node> Parser::parseDeclarator(const std::function<std::unique_ptr<Node>(const std::string&)>& makeElement)
{
    const Token nameToken = currentToken;
    consume(Type::IDENTIFIER, "a field name");
    const std::string name(nameToken.value);

    std::unique_ptr<Node> result;
    if (currentToken.type == Type::OPEN_BRACKET)
    {
        consume(Type::OPEN_BRACKET, "'['");
        const size_t count = parseCount();
        consume(Type::CLOSE_BRACKET, "']'");
        result = std::make_unique<ArrayNode>(name, count, makeElement(name));
    }
    else
    {
        result = makeElement(name);
    }
    result->line = nameToken.line;
    consume(Type::SEMICOLON, "';'");
    return result;
}

std::unique_ptr<BitfieldGroupNode> Parser::parseBitfield(PrimitiveKind base, int line)
{
    const auto& info = typeInfo(base);
    if (!isBitfieldBase(base))
        throw SyntaxError(line, "Bitfields require an unsigned integer type, not " + std::string(info.keyword));

    std::vector<BitfieldMember> members;
    unsigned total = 0;
    while (true)
    {
        const Token name = currentToken;
        consume(Type::IDENTIFIER, "a bitfield name");
        consume(Type::COLON, "':'");
        const size_t width = parseNumber();
        if (width == 0 || width > info.bits)
            throw SyntaxError(name.line, "Bitfield '" + std::string(name.value) + "' has invalid width " + std::to_string(width));
        total += static_cast<unsigned>(width);
        members.push_back({std::string(name.value), static_cast<unsigned>(width), name.line});

        if (currentToken.type != Type::COMMA)
            break;
        consume(Type::COMMA, "','");
    }
    consume(Type::SEMICOLON, "';'");

    if (total % 8 != 0)
        throw SyntaxError(line, "Bitfield widths sum to " + std::to_string(total) + " bits, not a whole number of bytes");
    if (total != info.bits)
        throw SyntaxError(line, "Bitfield widths sum to " + std::to_string(total) + " bits but " + std::string(info.keyword) + " holds " + std::to_string(info.bits));

    auto group = std::make_unique<BitfieldGroupNode>(base, std::move(members));
    group->line = line;
    return group;
}

std::unique_ptr<Node> Parser::parseDefinition()
{
    const Token typeToken = currentToken;
    consume(Type::TYPENAME, "a type");
    const PrimitiveKind kind = *kindFromKeyword(typeToken.value);

    if (currentToken.type == Type::IDENTIFIER && peek().type == Type::COLON)
        return parseBitfield(kind, typeToken.line);

    const bool isBit = typeToken.value == "bit" || typeToken.value == "lbit";
    if (isBit && peek().type != Type::OPEN_BRACKET)
        throw SyntaxError(typeToken.line, "'" + std::string(typeToken.value) + "' fields must be declared as arrays");

    auto node = parseDeclarator([kind](const std::string& name) {
        return std::make_unique<PrimitiveNode>(kind, name);
    });
    if (isBit)
    {
        const auto& array = static_cast<const ArrayNode&>(*node);
        if (array.count % 8 != 0)
            throw SyntaxError(array.line, "Bit array '" + array.name + "' must be a multiple of 8 bits, not " + std::to_string(array.count));
    }
    return node;
}

std::vector<std::unique_ptr<Node>> Parser::parseBlock()
{
    const int opened = currentToken.line;
    consume(Type::OPEN_BRACE, "'{'");
    std::vector<std::unique_ptr<Node>> nodes;
    while (currentToken.type != Type::CLOSE_BRACE) {
        if (currentToken.type == Type::END)
            throw SyntaxError(opened, "Unterminated block");
        if (auto item = parseItem())
            nodes.push_back(std::move(item));
    }

    consume(Type::CLOSE_BRACE, "'}'");
    return nodes;
}

std::unique_ptr<Node> Parser::parseStruct()
{
    const int line = currentToken.line;
    consume(Type::STRUCT, "'struct'");

    // struct NAME { ... };  is a type definition and declares nothing
    if (currentToken.type == Type::IDENTIFIER && peek().type == Type::OPEN_BRACE)
    {
        const std::string typeName(currentToken.value);
        consume(Type::IDENTIFIER, "a struct name");
        if (structTypes.contains(typeName))
            throw SyntaxError(line, "Redefinition of struct '" + typeName + "'");
        auto block = std::make_unique<RecordNode>(typeName, parseBlock());
        block->line = line;
        consume(Type::SEMICOLON, "';'");
        structTypes.emplace(typeName, std::move(block));
        return nullptr;
    }

    std::unique_ptr<RecordNode> layout;
    if (currentToken.type == Type::IDENTIFIER)
    {
        const Token typeName = currentToken;
        consume(Type::IDENTIFIER, "a struct name");
        auto it = structTypes.find(typeName.value);
        if (it == structTypes.end())
            throw SyntaxError(typeName.line, "Unknown struct type '" + std::string(typeName.value) + "'");
        layout = std::unique_ptr<RecordNode>(static_cast<RecordNode*>(it->second->clone().release()));
    }
    else
    {
        layout = std::make_unique<RecordNode>("", parseBlock());
    }
    layout->line = line;

    return parseDeclarator([&layout](const std::string& name) {
        auto copy = std::unique_ptr<RecordNode>(static_cast<RecordNode*>(layout->clone().release()));
        copy->name = name;
        return copy;
    });
}

std::unique_ptr<Node> Parser::parseUnion()
{
    const int line = currentToken.line;
    consume(Type::UNION, "'union'");

    auto layout = std::make_unique<RecordNode>("", parseBlock(), true);
    layout->line = line;
    if (layout->members.empty())
        throw SyntaxError(line, "Empty union");

    return parseDeclarator([&layout](const std::string& name) {
        auto copy = std::unique_ptr<RecordNode>(static_cast<RecordNode*>(layout->clone().release()));
        copy->name = name;
        return copy;
    });
}

std::unique_ptr<DirectiveNode> Parser::parseDirective()
{
    const Token directive = currentToken;
    std::unique_ptr<DirectiveNode> node;
    switch (directive.type)
    {
    case Type::SEEKTO:
        consume(Type::SEEKTO, "'#seekto'");
        node = std::make_unique<DirectiveNode>(DirectiveKind::SEEK_TO, parseNumber());
        break;
    case Type::SEEK:
        consume(Type::SEEK, "'#seek'");
        node = std::make_unique<DirectiveNode>(DirectiveKind::SEEK, parseNumber());
        break;
    default:
    {
        consume(Type::PRINTOFFSET, "'#printoffset'");
        const Token label = currentToken;
        consume(Type::STRING, "a quoted label");
        node = std::make_unique<DirectiveNode>(DirectiveKind::PRINT_OFFSET, 0, std::string(label.value));
        break;
    }
    }
    node->line = directive.line;
    consume(Type::SEMICOLON, "';'");
    return node;
}

std::unique_ptr<Node> Parser::parseItem()
{
    switch (currentToken.type)
    {
    case Type::TYPENAME:
        return parseDefinition();
    case Type::STRUCT:
        return parseStruct();
    case Type::UNION:
        return parseUnion();
    case Type::SEEKTO:
    case Type::SEEK:
    case Type::PRINTOFFSET:
        return parseDirective();
    case Type::IDENTIFIER:
        throw SyntaxError(currentToken.line, "Unknown type '" + std::string(currentToken.value) + "'");
    default:
        throw SyntaxError(currentToken.line, "Unexpected " + currentToken.to_string());
    }
}

std::unique_ptr<RecordNode> Parser::parseSchema()
{
    auto root = std::make_unique<RecordNode>("");
    root->line = currentToken.line;

    while (currentToken.type != Type::END)
    {
        if (auto item = parseItem())
            root->members.push_back(std::move(item));
    }
    return root;
}

CompiledSchema compile(std::string_view text)
{
    Lexer lexer(text);
    auto tokens = lexer.tokenize();
    Parser parser(tokens);
    auto root = parser.parseSchema();
    return CompiledSchema(std::string(text), std::move(root));
}

} // namespace bitwise
