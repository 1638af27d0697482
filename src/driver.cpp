#include "driver.hpp"

#include <fstream>
#include <string>
#include <system_error>

#include "boost/format.hpp"

#include "lox.hpp"
#include "report.hpp"
#include "syntax/scanner.hpp"

namespace lox {
    int Driver::run(std::istream& in) {
        if (hasScript()) {
            m_exitCode = runFile(m_scriptPath);
        } else {
            runPrompt(in);
            m_exitCode = 0;
        }

        return m_exitCode;
    }

    int Driver::runFile(const std::filesystem::path& path) {
        // A directory opens like a file but can never be read from.
        std::error_code ec;
        std::ifstream file;
        if (!std::filesystem::is_directory(path, ec))
            file.open(path, std::ios::binary);

        if (!file.is_open()) {
            reportError(m_err, (boost::format("could not open file '%1%'") % path.string()).str());
            return LOX_EXIT_NOINPUT;
        }

        // A failed read sets the badbit so it is not mistaken for an empty
        // script.
        std::string src;
        char chunk[4096];
        while (file.read(chunk, sizeof(chunk)) || file.gcount() > 0)
            src.append(chunk, (size_t)file.gcount());

        if (file.bad()) {
            reportError(m_err, (boost::format("could not read file '%1%'") % path.string()).str());
            return LOX_EXIT_NOINPUT;
        }

        // Indicate a lexical error in the exit code.
        if (runSource(src))
            return LOX_EXIT_DATAERR;

        return 0;
    }

    void Driver::runPrompt(std::istream& in) {
        std::string line;
        while (true) {
            m_out << "> " << std::flush;
            if (!std::getline(in, line))
                break;

            // Each line gets its own scan so an error only affects its line.
            runSource(line);
        }

        m_out << '\n';
    }

    bool Driver::runSource(std::string_view src) {
        auto result = scanTokens(src);

        for (auto& diag : result.diagnostics)
            reportDiagnostic(m_err, diag, src);

        for (auto& tok : result.tokens)
            m_out << tokenRepr(tok) << '\n';

        return result.hadError();
    }
}
