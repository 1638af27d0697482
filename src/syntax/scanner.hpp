#ifndef _SCANNER_H_
#define _SCANNER_H_

#include <string>
#include <string_view>
#include <vector>

#include "token.hpp"
#include "report.hpp"

namespace lox {
    // CharClass enumerates the categories a source character can fall into.
    // The scanner decides what to do with a character based only on its class.
    enum class CharClass {
        WHITESPACE,   // ` `, `\r`, `\t`
        NEWLINE,      // `\n`
        PUNCTUATION,  // Characters that always form a one character token.
        OPERATOR,     // `!`, `=`, `<`, `>`: may be followed by `=`.
        SLASH,        // `/`: division or the start of a line comment.
        QUOTE,        // `"`
        DIGIT,
        ALPHA,        // ASCII letters and `_`.
        UNKNOWN,
    };

    // classifyChar returns the character class of `c`.
    CharClass classifyChar(char c);

    // ScanResult is the output of a single scan: the tokens that could be
    // recognized and every lexical error encountered along the way.
    struct ScanResult {
        std::vector<Token> tokens;
        std::vector<Diagnostic> diagnostics;

        // hadError returns whether any lexical error occurred.
        inline bool hadError() const { return !diagnostics.empty(); }
    };

    // Scanner is responsible for tokenizing lox source text.  It makes a
    // single pass over the text, left to right, using at most two characters
    // of lookahead.
    class Scanner {
        // The source text being scanned.
        std::string_view m_src;

        // The tokens emitted so far.
        std::vector<Token> m_tokens;

        // The errors recorded so far.
        std::vector<Diagnostic> m_diagnostics;

        // The index of the first character of the current lexeme and the index
        // of the next unread character.
        size_t m_start { 0 }, m_current { 0 };

        // The current line and the line the current lexeme started on.
        size_t m_line { 1 }, m_startLine { 1 };

    public:
        // Creates a new scanner over `src`.  The text must outlive the
        // scanner.
        Scanner(std::string_view src)
        : m_src(src)
        {}

        // scanTokens scans the whole source text.  The result always ends with
        // a single END_OF_FILE token, no matter how many errors occurred.
        ScanResult scanTokens();

    private:
        // scanToken scans the lexeme starting at `m_start`.
        void scanToken();

        // scanUnexpected records an unexpected character starting with `c`.
        // All bytes of a multi-byte UTF-8 character are consumed together.
        void scanUnexpected(char c);

        // scanOperator emits the operator token starting with `c`, taking the
        // two character form if the next character is `=`.
        void scanOperator(char c);

        // skipComment skips a line comment up to but not including the newline.
        void skipComment();

        // scanString scans a string literal.  The opening quote is consumed.
        void scanString();

        // scanNumber scans a numeric literal.  The first digit is consumed.
        void scanNumber();

        // scanKeywordOrIdent scans a keyword or identifier.  The first
        // character is consumed.
        void scanKeywordOrIdent();

        /* ------------------------------------------------------------------ */

        // addToken emits a token of `kind` spanning the current lexeme.
        void addToken(TokenKind kind, Literal literal = {});

        // error records a lexical error on the current line.
        void error(DiagnosticKind kind, std::string&& message);

        /* ------------------------------------------------------------------ */

        // lexeme returns a view of the current lexeme.
        inline std::string_view lexeme() const {
            return m_src.substr(m_start, m_current - m_start);
        }

        // isAtEnd returns whether all of the source text has been consumed.
        inline bool isAtEnd() const { return m_current >= m_src.size(); }

        // advance consumes and returns the next character.
        char advance();

        // match consumes the next character only if it is `expected`.
        bool match(char expected);

        // peek returns the next character without consuming it or `\0` at the
        // end of the source text.
        char peek() const;

        // peekNext returns the character after the next one or `\0` if it does
        // not exist.
        char peekNext() const;
    };

    // scanTokens scans `src` with a fresh scanner.
    ScanResult scanTokens(std::string_view src);
}

#endif
