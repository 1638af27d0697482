#ifndef _KEYWORDS_H_
#define _KEYWORDS_H_

#include <optional>
#include <string_view>
#include <unordered_map>

#include "token.hpp"

namespace lox {
    // keywordTable returns the table of reserved words matched to their token
    // kinds.  The table is constant for the lifetime of the program.
    const std::unordered_map<std::string_view, TokenKind>& keywordTable();

    // lookupKeyword returns the token kind of the reserved word `text`.  If
    // `text` is not a reserved word, then `std::nullopt` is returned.  Lookup
    // is case-sensitive.
    std::optional<TokenKind> lookupKeyword(std::string_view text);
}

#endif
