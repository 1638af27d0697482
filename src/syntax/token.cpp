#include "token.hpp"

#include <charconv>

namespace lox {
    std::string_view tokenKindName(TokenKind kind) {
        switch (kind) {
        case TokenKind::LEFT_PAREN: return "LEFT_PAREN";
        case TokenKind::RIGHT_PAREN: return "RIGHT_PAREN";
        case TokenKind::LEFT_BRACE: return "LEFT_BRACE";
        case TokenKind::RIGHT_BRACE: return "RIGHT_BRACE";
        case TokenKind::COMMA: return "COMMA";
        case TokenKind::DOT: return "DOT";
        case TokenKind::MINUS: return "MINUS";
        case TokenKind::PLUS: return "PLUS";
        case TokenKind::SEMICOLON: return "SEMICOLON";
        case TokenKind::SLASH: return "SLASH";
        case TokenKind::STAR: return "STAR";

        case TokenKind::BANG: return "BANG";
        case TokenKind::BANG_EQUAL: return "BANG_EQUAL";
        case TokenKind::EQUAL: return "EQUAL";
        case TokenKind::EQUAL_EQUAL: return "EQUAL_EQUAL";
        case TokenKind::GREATER: return "GREATER";
        case TokenKind::GREATER_EQUAL: return "GREATER_EQUAL";
        case TokenKind::LESS: return "LESS";
        case TokenKind::LESS_EQUAL: return "LESS_EQUAL";

        case TokenKind::IDENTIFIER: return "IDENTIFIER";
        case TokenKind::STRING: return "STRING";
        case TokenKind::NUMBER: return "NUMBER";

        case TokenKind::AND: return "AND";
        case TokenKind::CLASS: return "CLASS";
        case TokenKind::ELSE: return "ELSE";
        case TokenKind::FALSE: return "FALSE";
        case TokenKind::FOR: return "FOR";
        case TokenKind::FUN: return "FUN";
        case TokenKind::IF: return "IF";
        case TokenKind::NIL: return "NIL";
        case TokenKind::OR: return "OR";
        case TokenKind::PRINT: return "PRINT";
        case TokenKind::RETURN: return "RETURN";
        case TokenKind::SUPER: return "SUPER";
        case TokenKind::THIS: return "THIS";
        case TokenKind::TRUE: return "TRUE";
        case TokenKind::VAR: return "VAR";
        case TokenKind::WHILE: return "WHILE";

        case TokenKind::END_OF_FILE: return "EOF";
        }

        return "UNKNOWN";
    }

    /* ---------------------------------------------------------------------- */

    std::string literalRepr(const Literal& literal) {
        if (auto* num = std::get_if<double>(&literal)) {
            // Print the shortest form which reads back as the same number.
            char buff[32];
            auto result = std::to_chars(buff, buff + sizeof(buff), *num);
            return std::string(buff, result.ptr);
        } else if (auto* str = std::get_if<std::string>(&literal)) {
            return *str;
        }

        return "null";
    }

    std::string tokenRepr(const Token& tok) {
        std::string repr { tokenKindName(tok.kind) };
        repr += ' ';
        repr += tok.lexeme;
        repr += ' ';
        repr += literalRepr(tok.literal);
        return repr;
    }

    std::ostream& operator<<(std::ostream& os, TokenKind kind) {
        return os << tokenKindName(kind);
    }
}
