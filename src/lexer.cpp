#include "lexer.hpp"
#include "errors.hpp"
#include "types.hpp"
#include <cctype>

namespace bitwise {

std::string Token::to_string() const
{
    if (type == Type::END)
        return "end of input";
    return "'" + std::string(value) + "'";
}

void Lexer::skip_whitespace_and_comments() {
    while (!is_eof()) {
        if (std::isspace(static_cast<unsigned char>(peek()))) {
            advance();
        } else if (source.substr(cursor).starts_with("//")) {
            while (!is_eof() && peek() != '\n') advance();
        } else {
            break;
        }
    }
}

std::vector<Token> Lexer::tokenize() {
    std::vector<Token> tokens;

    while (true) {
        skip_whitespace_and_comments();
        if (is_eof()) break;

        size_t start = cursor;
        int startLine = line;

        if (std::isdigit(static_cast<unsigned char>(peek()))) {
            if (source.substr(cursor).starts_with("0x") || source.substr(cursor).starts_with("0X")) {
                cursor += 2;
                while (!is_eof() && std::isxdigit(static_cast<unsigned char>(peek()))) advance();
            } else {
                while (!is_eof() && std::isdigit(static_cast<unsigned char>(peek()))) advance();
            }
            tokens.push_back({Type::NUMBER, source.substr(start, cursor - start), startLine});
            continue;
        }

        char c = peek();

        if (c == '"') {
            advance();
            while (!is_eof() && peek() != '"' && peek() != '\n') advance();
            if (peek() != '"')
                throw SyntaxError(startLine, "Unterminated string literal");
            tokens.push_back({Type::STRING, source.substr(start + 1, cursor - start - 1), startLine});
            advance();
            continue;
        }

        if (std::isalpha(static_cast<unsigned char>(c)) || c == '_' || c == '#') {
            advance();
            while (!is_eof() && (std::isalnum(static_cast<unsigned char>(peek())) || peek() == '_')) {
                advance();
            }

            std::string_view word = source.substr(start, cursor - start);

            if (word == "struct")               tokens.push_back({Type::STRUCT, word, startLine});
            else if (word == "union")           tokens.push_back({Type::UNION, word, startLine});
            else if (word == "#seekto")         tokens.push_back({Type::SEEKTO, word, startLine});
            else if (word == "#seek")           tokens.push_back({Type::SEEK, word, startLine});
            else if (word == "#printoffset")    tokens.push_back({Type::PRINTOFFSET, word, startLine});
            else if (word.starts_with("#"))
                throw SyntaxError(startLine, "Unknown directive '" + std::string(word) + "'");
            else if (kindFromKeyword(word))     tokens.push_back({Type::TYPENAME, word, startLine});
            else                                tokens.push_back({Type::IDENTIFIER, word, startLine});
            continue;
        }

        Type symType;
        switch (c) {
            case ':': symType = Type::COLON; break;
            case ',': symType = Type::COMMA; break;
            case ';': symType = Type::SEMICOLON; break;
            case '{': symType = Type::OPEN_BRACE; break;
            case '}': symType = Type::CLOSE_BRACE; break;
            case '[': symType = Type::OPEN_BRACKET; break;
            case ']': symType = Type::CLOSE_BRACKET; break;
            default:
                throw SyntaxError(startLine, std::string("Unknown character '") + c + "'");
        }

        tokens.push_back({symType, source.substr(cursor, 1), startLine});
        advance();
    }

    tokens.push_back({Type::END, "", line});
    return tokens;
}

} // namespace bitwise
