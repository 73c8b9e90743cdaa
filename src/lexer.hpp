#pragma once
#include <string_view>
#include <string>
#include <vector>

namespace bitwise {

enum class Type
{
    STRUCT,
    UNION,
    TYPENAME,      // u8, ul16, bbcd, char, bit, ...
    SEEKTO,
    SEEK,
    PRINTOFFSET,
    NUMBER,
    STRING,
    IDENTIFIER,
    OPEN_BRACE,
    CLOSE_BRACE,
    OPEN_BRACKET,
    CLOSE_BRACKET,
    COLON,
    SEMICOLON,
    COMMA,
    END = -1,
};

struct Token
{
    Type type;
    std::string_view value; // views into the schema text, which must outlive the tokens
    int line = 1;
    std::string to_string() const;
};

class Lexer
{
    std::string_view source;
    size_t cursor = 0;
    int line = 1;

public:
    explicit Lexer(std::string_view src) : source(src) {}
    std::vector<Token> tokenize();

private:
    void skip_whitespace_and_comments();
    constexpr bool is_eof() const { return cursor >= source.length(); }
    constexpr char peek() const { return is_eof() ? '\0' : source[cursor]; }
    void advance()
    {
        if (source[cursor] == '\n') line++;
        cursor++;
    }
};

} // namespace bitwise
