#ifndef _TOKEN_H_
#define _TOKEN_H_

#include <string>
#include <string_view>
#include <variant>
#include <ostream>
#include <cstddef>

namespace lox {
    // Enumeration of different kinds of tokens.
    enum class TokenKind {
        LEFT_PAREN,
        RIGHT_PAREN,
        LEFT_BRACE,
        RIGHT_BRACE,
        COMMA,
        DOT,
        MINUS,
        PLUS,
        SEMICOLON,
        SLASH,
        STAR,

        BANG,
        BANG_EQUAL,
        EQUAL,
        EQUAL_EQUAL,
        GREATER,
        GREATER_EQUAL,
        LESS,
        LESS_EQUAL,

        IDENTIFIER,
        STRING,
        NUMBER,

        AND,
        CLASS,
        ELSE,
        FALSE,
        FOR,
        FUN,
        IF,
        NIL,
        OR,
        PRINT,
        RETURN,
        SUPER,
        THIS,
        TRUE,
        VAR,
        WHILE,

        END_OF_FILE,
    };

    // Literal is the decoded payload of a literal token: a number for numeric
    // literals, the string contents for string literals, and empty otherwise.
    using Literal = std::variant<std::monostate, double, std::string>;

    // Token represents a single lexical token.
    struct Token {
        TokenKind kind { TokenKind::END_OF_FILE };
        std::string lexeme;
        Literal literal;

        // The 1-based line the token starts on.
        size_t line { 1 };

        // hasLiteral returns whether the token carries a decoded literal.
        inline bool hasLiteral() const {
            return !std::holds_alternative<std::monostate>(literal);
        }
    };

    // tokenKindName returns the display name of `kind`, eg. `BANG_EQUAL`.
    std::string_view tokenKindName(TokenKind kind);

    // literalRepr returns the printed form of a literal: the number, the raw
    // string contents, or `null` if there is no literal.
    std::string literalRepr(const Literal& literal);

    // tokenRepr returns the human-readable form of `tok`: its kind, lexeme and
    // literal separated by spaces.
    std::string tokenRepr(const Token& tok);

    std::ostream& operator<<(std::ostream& os, TokenKind kind);
}

#endif
