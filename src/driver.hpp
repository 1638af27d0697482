#ifndef _DRIVER_H_
#define _DRIVER_H_

#include <filesystem>
#include <iostream>
#include <string>
#include <string_view>

namespace lox {
    // Driver represents the global state of the lox front end: it reads the
    // command-line, picks between file and prompt mode, and prints the tokens
    // of whatever it scans.
    class Driver {
        // The path to the script to scan.  This is empty in prompt mode.
        std::string m_scriptPath;

        // The exit status of the driver.
        int m_exitCode { 0 };

        // The streams tokens and diagnostics are written to.
        std::ostream& m_out;
        std::ostream& m_err;

    public:
        Driver(std::ostream& out = std::cout, std::ostream& err = std::cerr)
        : m_out(out)
        , m_err(err)
        {}

        // initFromArgs initializes the driver based on the command-line
        // arguments.  It returns whether scanning should continue: if it
        // returns false, `exitCode` holds the status the process should exit
        // with.
        bool initFromArgs(int argc, char* argv[]);

        // run scans the script if one was given, or runs the prompt over `in`
        // otherwise.  It returns the process exit status.
        int run(std::istream& in = std::cin);

        // runFile scans the file at `path` and returns the process exit
        // status.
        int runFile(const std::filesystem::path& path);

        // runPrompt scans each line read from `in` until end of input.  Errors
        // on one line never affect the next line or the exit status.
        void runPrompt(std::istream& in);

        // runSource scans `src`, reports any lexical errors and prints the
        // resulting tokens.  It returns whether a lexical error occurred.
        bool runSource(std::string_view src);

        // exitCode returns the exit status decided by the driver.
        inline int exitCode() const { return m_exitCode; }

        // scriptPath returns a view to the path of the script to scan.
        inline std::string_view scriptPath() const { return m_scriptPath; }

        // hasScript returns whether the driver runs in file mode.
        inline bool hasScript() const { return !m_scriptPath.empty(); }
    };
}

#endif
