#include "keywords.hpp"

namespace lox {
    // The table of keyword patterns matched to their token kinds.
    static const std::unordered_map<std::string_view, TokenKind> keywordPatterns {
        { "and", TokenKind::AND },
        { "class", TokenKind::CLASS },
        { "else", TokenKind::ELSE },
        { "false", TokenKind::FALSE },
        { "for", TokenKind::FOR },
        { "fun", TokenKind::FUN },
        { "if", TokenKind::IF },
        { "nil", TokenKind::NIL },
        { "or", TokenKind::OR },
        { "print", TokenKind::PRINT },
        { "return", TokenKind::RETURN },
        { "super", TokenKind::SUPER },
        { "this", TokenKind::THIS },
        { "true", TokenKind::TRUE },
        { "var", TokenKind::VAR },
        { "while", TokenKind::WHILE },
    };

    const std::unordered_map<std::string_view, TokenKind>& keywordTable() {
        return keywordPatterns;
    }

    std::optional<TokenKind> lookupKeyword(std::string_view text) {
        auto it = keywordPatterns.find(text);
        if (it == keywordPatterns.end())
            return std::nullopt;

        return it->second;
    }
}
