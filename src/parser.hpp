#pragma once
#include "lexer.hpp"
#include "ast.hpp"
#include "errors.hpp"
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>

namespace bitwise {

// Field tree of one schema. Immutable once compiled.
class CompiledSchema
{
    std::string source_;
    std::unique_ptr<RecordNode> root_;

public:
    CompiledSchema(std::string source, std::unique_ptr<RecordNode> root) : source_(std::move(source)), root_(std::move(root)) {}

    const std::string& source() const { return source_; }
    const RecordNode& root() const { return *root_; }
};

class Parser
{
    Token currentToken;
    std::vector<Token> tokens;
    size_t position = 0;

    // struct NAME { ... }; definitions, instantiated by copy on use
    std::map<std::string, std::unique_ptr<RecordNode>, std::less<>> structTypes;

    inline void consume(Type type, std::string_view expected)
    {
        if (currentToken.type == type)
        {
            position++;
            if (position < tokens.size())
                currentToken = tokens[position];
        }
        else
            throw SyntaxError(currentToken.line, "Expected " + std::string(expected) + " but found " + currentToken.to_string());
    }

    inline Token peek(int offset = 1) {
        if (position + offset >= tokens.size())
            return tokens.back();

        return tokens[position + offset];
    }

public:
    explicit Parser(const std::vector<Token>& toks) : tokens(toks)
    {
        currentToken = tokens[position];
    }

    std::unique_ptr<RecordNode> parseSchema();

    // Returns nullptr for items that declare no field (named struct definitions).
    std::unique_ptr<Node> parseItem();
    std::vector<std::unique_ptr<Node>> parseBlock();

    std::unique_ptr<Node> parseDefinition();
    std::unique_ptr<BitfieldGroupNode> parseBitfield(PrimitiveKind base, int line);
    std::unique_ptr<Node> parseStruct();
    std::unique_ptr<Node> parseUnion();
    std::unique_ptr<DirectiveNode> parseDirective();

    // NAME or NAME[count], then ';'. makeElement builds the (element) node for NAME.
    std::unique_ptr<Node> parseDeclarator(const std::function<std::unique_ptr<Node>(const std::string&)>& makeElement);

    size_t parseNumber();
    size_t parseCount();
};

// Pure function of the text; throws SyntaxError and never returns a partial schema.
CompiledSchema compile(std::string_view text);

} // namespace bitwise
