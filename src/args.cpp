#include "driver.hpp"

#include <unordered_map>

#include "boost/program_options.hpp"

#include "lox.hpp"
#include "report.hpp"

namespace po = boost::program_options;

namespace lox {
    // OptionKind represents a command-line option kind: it is used to map
    // option names to integral values so they can be switched over.
    enum class OptionKind {
        SCRIPT,   // [script]
        HELP,     // --help
        VERSION,  // --version
        LOGLEVEL, // --loglevel
    };

    // A table mapping option names to integral option kinds.
    static const std::unordered_map<std::string, OptionKind> optionNameToKind {
        { "script", OptionKind::SCRIPT },
        { "help", OptionKind::HELP },
        { "version", OptionKind::VERSION },
        { "loglevel", OptionKind::LOGLEVEL },
    };

    // The usage line printed for command-line errors.
    static constexpr std::string_view usageLine = "Usage: lox [script]";

    bool Driver::initFromArgs(int argc, char* argv[]) {
        // Build the command-line parser.
        po::options_description visibleDesc("usage: lox [options] [script]\n\nOptions");

        visibleDesc.add_options()
            ("help,h", "Display usage information (ie. this text).")
            ("version,v", "Displays the current version.")
            ("loglevel", po::value<std::string>()->default_value("error")->value_name("<log level>"),
                "Sets the diagnostic log level.  Valid values are:\n"
                "  - \"silent\" for no diagnostic output\n"
                "  - \"error\" for one line per error (default)\n"
                "  - \"verbose\" for errors followed by the offending source line"
            )
        ;

        po::options_description hiddenDesc;
        hiddenDesc.add_options()
            ("script", po::value<std::string>(), "the script to scan")
        ;

        po::positional_options_description positionalDesc;
        positionalDesc.add("script", 1);

        po::options_description combinedDesc;
        combinedDesc.add(visibleDesc).add(hiddenDesc);

        // Run the parser on the command-line arguments.
        po::variables_map parseResult;
        try {
            po::store(
                po::command_line_parser(argc, argv)
                .options(combinedDesc)
                .positional(positionalDesc)
                .run(),
                parseResult
            );
            po::notify(parseResult);
        } catch (po::too_many_positional_options_error&) {
            m_err << usageLine << '\n';
            m_exitCode = LOX_EXIT_USAGE;
            return false;
        } catch (po::error& e) {
            reportError(m_err, e);
            m_err << usageLine << '\n';
            m_exitCode = LOX_EXIT_USAGE;
            return false;
        }

        // Apply each of the arguments to the driver.
        for (auto& option : parseResult) {
            auto kind = optionNameToKind.at(option.first);

            switch (kind) {
            case OptionKind::SCRIPT:
                m_scriptPath = option.second.as<std::string>();
                break;
            case OptionKind::HELP:
                m_out << visibleDesc << '\n';
                m_exitCode = 0;
                return false;
            case OptionKind::VERSION:
                m_out << LOX_NAME << " " << LOX_VERSION << '\n';
                m_exitCode = 0;
                return false;
            case OptionKind::LOGLEVEL:
            {
                auto& name = option.second.as<std::string>();

                if (!parseLogLevel(name, reporterLogLevel)) {
                    reportError(m_err, "invalid log level: " + name);
                    m_exitCode = LOX_EXIT_USAGE;
                    return false;
                }

                break;
            }
            }
        }

        // If we reach here then initialization was successful and we return true.
        return true;
    }
}
