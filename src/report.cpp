#include "report.hpp"

#include <unordered_map>

#include "boost/algorithm/string/replace.hpp"
#include "boost/format.hpp"

namespace balgo = boost::algorithm;

namespace lox {
    // A table mapping log level names to LogLevel values.
    static const std::unordered_map<std::string_view, LogLevel> logLevelNameToEnum {
        { "silent", LogLevel::SILENT },
        { "error", LogLevel::ERROR },
        { "verbose", LogLevel::VERBOSE },
    };

    // sourceLine returns the 1-based line `lineNumber` of `src`.  If the line
    // does not exist, an empty string is returned.
    static std::string sourceLine(std::string_view src, size_t lineNumber) {
        size_t lineStart = 0;
        for (size_t n = 1; n < lineNumber; n++) {
            lineStart = src.find('\n', lineStart);
            if (lineStart == std::string_view::npos)
                return "";

            lineStart++;
        }

        auto lineEnd = src.find('\n', lineStart);
        if (lineEnd == std::string_view::npos)
            lineEnd = src.size();

        std::string line { src.substr(lineStart, lineEnd - lineStart) };

        // Drop the carriage return of CRLF line endings.
        if (!line.empty() && line.back() == '\r')
            line.pop_back();

        return line;
    }

    // displaySourceLine displays the source line a diagnostic occurs on
    // prefixed by its line number and a padding bar.
    static void displaySourceLine(std::ostream& os, const Diagnostic& diag, std::string_view src) {
        std::string line = sourceLine(src, diag.line);
        balgo::replace_all(line, "\t", "    ");

        std::string lineNumber = std::to_string(diag.line);
        os << lineNumber << " | " << line << '\n';
    }

    // -------------------------------------------------------------------------- //

    LogLevel reporterLogLevel = LogLevel::ERROR;

    bool parseLogLevel(std::string_view name, LogLevel& level) {
        auto it = logLevelNameToEnum.find(name);
        if (it == logLevelNameToEnum.end())
            return false;

        level = it->second;
        return true;
    }

    std::string formatDiagnostic(const Diagnostic& diag) {
        return (boost::format("[line %1%] Error%2%: %3%") % diag.line % diag.where % diag.message).str();
    }

    void reportDiagnostic(std::ostream& os, const Diagnostic& diag, std::string_view src) {
        if (reporterLogLevel == LogLevel::SILENT)
            return;

        os << formatDiagnostic(diag) << '\n';

        if (reporterLogLevel == LogLevel::VERBOSE)
            displaySourceLine(os, diag, src);
    }

    void reportError(std::ostream& os, std::string_view message) {
        if (reporterLogLevel > LogLevel::SILENT) {
            os << "[error] " << message << '\n';
        }
    }

    void reportError(std::ostream& os, const std::exception& e) {
        reportError(os, e.what());
    }
}
