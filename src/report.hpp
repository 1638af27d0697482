#ifndef _REPORT_H_
#define _REPORT_H_

#include <exception>
#include <ostream>
#include <string>
#include <string_view>
#include <cstddef>

namespace lox {
    // LogLevel enumerates the diagnostic output levels of the front end.
    enum class LogLevel {
        SILENT,   // No output.
        ERROR,    // One line per error (default).
        VERBOSE,  // Errors followed by the offending source line.
    };

    // DiagnosticKind enumerates the kinds of lexical errors.
    enum class DiagnosticKind {
        UNEXPECTED_CHARACTER,
        UNTERMINATED_STRING,
    };

    // Diagnostic represents an error found in user source text.  Diagnostics
    // never halt scanning: they are collected and reported afterward.
    struct Diagnostic {
        DiagnosticKind kind;

        // The 1-based line the error was found on.
        size_t line { 1 };

        // The location suffix printed after `Error`.  This is empty for
        // lexical errors.
        std::string where;

        std::string message;
    };

    // The global log level.
    extern LogLevel reporterLogLevel;

    // parseLogLevel converts a log level name (`silent`, `error`, `verbose`)
    // into a log level.  It returns false if the name is not valid.
    bool parseLogLevel(std::string_view name, LogLevel& level);

    // formatDiagnostic returns the one-line form of `diag`:
    // `[line <N>] Error<where>: <message>`.
    std::string formatDiagnostic(const Diagnostic& diag);

    // reportDiagnostic writes `diag` to `os`.  `src` is the text the diagnostic
    // refers to and is used to display the offending line in verbose mode.
    void reportDiagnostic(std::ostream& os, const Diagnostic& diag, std::string_view src);

    // reportError reports an error with no source position.
    void reportError(std::ostream& os, std::string_view message);

    // reportError reports a standard exception.
    void reportError(std::ostream& os, const std::exception& e);
}

#endif
