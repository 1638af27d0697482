#include "scanner.hpp"

#include <charconv>
#include <limits>
#include <string>
#include <system_error>
#include <unordered_map>
#include <utility>

#include "boost/format.hpp"

#include "keywords.hpp"

namespace lox {
    // The table of single character punctuation matched to their token kinds.
    static const std::unordered_map<char, TokenKind> punctuationPatterns {
        { '(', TokenKind::LEFT_PAREN },
        { ')', TokenKind::RIGHT_PAREN },
        { '{', TokenKind::LEFT_BRACE },
        { '}', TokenKind::RIGHT_BRACE },
        { ',', TokenKind::COMMA },
        { '.', TokenKind::DOT },
        { '-', TokenKind::MINUS },
        { '+', TokenKind::PLUS },
        { ';', TokenKind::SEMICOLON },
        { '*', TokenKind::STAR },
    };

    // The table of operators which may be followed by `=`: the first kind is
    // the bare operator and the second is the operator with `=` appended.
    static const std::unordered_map<char, std::pair<TokenKind, TokenKind>> operatorPatterns {
        { '!', { TokenKind::BANG, TokenKind::BANG_EQUAL } },
        { '=', { TokenKind::EQUAL, TokenKind::EQUAL_EQUAL } },
        { '<', { TokenKind::LESS, TokenKind::LESS_EQUAL } },
        { '>', { TokenKind::GREATER, TokenKind::GREATER_EQUAL } },
    };

    static bool isDigit(char c) {
        return '0' <= c && c <= '9';
    }

    static bool isAlpha(char c) {
        return ('a' <= c && c <= 'z') || ('A' <= c && c <= 'Z') || c == '_';
    }

    static bool isAlphaNumeric(char c) {
        return isAlpha(c) || isDigit(c);
    }

    // utf8SequenceLength returns the length of the UTF-8 sequence introduced
    // by `lead` or 0 if `lead` cannot start a sequence.
    static size_t utf8SequenceLength(char lead) {
        auto b = (unsigned char)lead;
        if (b < 0x80)
            return 1;
        else if (0xc2 <= b && b <= 0xdf)
            return 2;
        else if (0xe0 <= b && b <= 0xef)
            return 3;
        else if (0xf0 <= b && b <= 0xf4)
            return 4;

        return 0;
    }

    static bool isUtf8Continuation(char c) {
        return ((unsigned char)c & 0xc0) == 0x80;
    }

    CharClass classifyChar(char c) {
        switch (c) {
        case ' ':
        case '\r':
        case '\t':
            return CharClass::WHITESPACE;
        case '\n':
            return CharClass::NEWLINE;
        case '/':
            return CharClass::SLASH;
        case '"':
            return CharClass::QUOTE;
        default:
            if (punctuationPatterns.contains(c))
                return CharClass::PUNCTUATION;
            else if (operatorPatterns.contains(c))
                return CharClass::OPERATOR;
            else if (isDigit(c))
                return CharClass::DIGIT;
            else if (isAlpha(c))
                return CharClass::ALPHA;

            return CharClass::UNKNOWN;
        }
    }

    /* ---------------------------------------------------------------------- */

    ScanResult Scanner::scanTokens() {
        while (!isAtEnd()) {
            // We are at the beginning of the next lexeme.
            m_start = m_current;
            m_startLine = m_line;
            scanToken();
        }

        // The end of file token is never part of any lexeme.
        m_start = m_current;
        m_startLine = m_line;
        addToken(TokenKind::END_OF_FILE);

        return { std::move(m_tokens), std::move(m_diagnostics) };
    }

    void Scanner::scanToken() {
        char c = advance();

        switch (classifyChar(c)) {
        case CharClass::WHITESPACE:
            break;
        case CharClass::NEWLINE:
            m_line++;
            break;
        case CharClass::PUNCTUATION:
            addToken(punctuationPatterns.at(c));
            break;
        case CharClass::OPERATOR:
            scanOperator(c);
            break;
        case CharClass::SLASH:
            if (match('/'))
                skipComment();
            else
                addToken(TokenKind::SLASH);
            break;
        case CharClass::QUOTE:
            scanString();
            break;
        case CharClass::DIGIT:
            scanNumber();
            break;
        case CharClass::ALPHA:
            scanKeywordOrIdent();
            break;
        case CharClass::UNKNOWN:
            scanUnexpected(c);
            break;
        }
    }

    void Scanner::scanUnexpected(char c) {
        // A multi-byte UTF-8 character is a single unexpected character.
        size_t length = utf8SequenceLength(c);
        size_t n = 1;
        while (n < length && isUtf8Continuation(peek())) {
            advance();
            n++;
        }

        std::string display;
        if (length > 0 && n == length) {
            display = lexeme();
        } else {
            // Malformed sequences are shown byte by byte so the message stays
            // valid text.
            for (char b : lexeme())
                display += (boost::format("\\x%02x") % (unsigned)(unsigned char)b).str();
        }

        error(DiagnosticKind::UNEXPECTED_CHARACTER, (boost::format("Unexpected character '%1%'.") % display).str());
    }

    void Scanner::scanOperator(char c) {
        auto& kinds = operatorPatterns.at(c);
        addToken(match('=') ? kinds.second : kinds.first);
    }

    void Scanner::skipComment() {
        // A comment consumes the remainder of the line it is on.
        while (peek() != '\n' && !isAtEnd())
            advance();
    }

    void Scanner::scanString() {
        while (peek() != '"' && !isAtEnd()) {
            if (peek() == '\n')
                m_line++;

            advance();
        }

        if (isAtEnd()) {
            error(DiagnosticKind::UNTERMINATED_STRING, "Unterminated string.");
            return;
        }

        // Skip the closing quote.
        advance();

        // The value excludes both quotes and is taken as written.
        std::string value { m_src.substr(m_start + 1, m_current - m_start - 2) };
        addToken(TokenKind::STRING, std::move(value));
    }

    void Scanner::scanNumber() {
        while (isDigit(peek()))
            advance();

        // Look for a fractional part: the `.` only belongs to the number if a
        // digit follows it.
        if (peek() == '.' && isDigit(peekNext())) {
            advance();

            while (isDigit(peek()))
                advance();
        }

        auto text = lexeme();

        // The lexeme is always a well-formed decimal so conversion can only
        // fail by being out of range.  A nonzero integer part means the value
        // is at least 1 and overflowed to infinity: otherwise it is too small
        // for any subnormal and rounds to zero.
        double value = 0;
        auto result = std::from_chars(text.data(), text.data() + text.size(), value);
        if (result.ec == std::errc::result_out_of_range) {
            auto intPart = text.substr(0, text.find('.'));
            if (intPart.find_first_not_of('0') != std::string_view::npos)
                value = std::numeric_limits<double>::infinity();
            else
                value = 0.0;
        }

        addToken(TokenKind::NUMBER, value);
    }

    void Scanner::scanKeywordOrIdent() {
        while (isAlphaNumeric(peek()))
            advance();

        if (auto kind = lookupKeyword(lexeme()))
            addToken(*kind);
        else
            addToken(TokenKind::IDENTIFIER);
    }

    /* ---------------------------------------------------------------------- */

    void Scanner::addToken(TokenKind kind, Literal literal) {
        m_tokens.push_back(Token {
            .kind { kind },
            .lexeme { std::string(lexeme()) },
            .literal { std::move(literal) },
            .line { m_startLine },
        });
    }

    void Scanner::error(DiagnosticKind kind, std::string&& message) {
        m_diagnostics.push_back(Diagnostic {
            .kind { kind },
            .line { m_line },
            .where { },
            .message { std::move(message) },
        });
    }

    /* ---------------------------------------------------------------------- */

    char Scanner::advance() {
        return m_src[m_current++];
    }

    bool Scanner::match(char expected) {
        if (isAtEnd() || m_src[m_current] != expected)
            return false;

        m_current++;
        return true;
    }

    char Scanner::peek() const {
        return isAtEnd() ? '\0' : m_src[m_current];
    }

    char Scanner::peekNext() const {
        return m_current + 1 < m_src.size() ? m_src[m_current + 1] : '\0';
    }

    /* ---------------------------------------------------------------------- */

    ScanResult scanTokens(std::string_view src) {
        Scanner sc(src);
        return sc.scanTokens();
    }
}
