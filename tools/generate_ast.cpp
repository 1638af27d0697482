#include <iostream>
#include <string>
#include <vector>

#include "boost/program_options.hpp"

#include "astgen.hpp"
#include "lox.hpp"
#include "report.hpp"

namespace po = boost::program_options;

namespace lox {
    // The expression grammar the parser is built on.
    static const std::vector<std::string> exprSpecs {
        "Binary   : Expr left, Token op, Expr right",
        "Grouping : Expr expression",
        "Literal  : Literal value",
        "Unary    : Token op, Expr right",
    };

    // generate is the main entry point for the AST generator.
    static int generate(int argc, char* argv[]) {
        po::options_description desc;
        desc.add_options()
            ("outdir", po::value<std::string>(), "the output directory")
        ;

        po::positional_options_description positionalDesc;
        positionalDesc.add("outdir", 1);

        po::variables_map parseResult;
        try {
            po::store(
                po::command_line_parser(argc, argv)
                .options(desc)
                .positional(positionalDesc)
                .run(),
                parseResult
            );
            po::notify(parseResult);
        } catch (po::error&) {
            std::cerr << "Usage: generate_ast <output directory>\n";
            return LOX_EXIT_USAGE;
        }

        if (!parseResult.count("outdir")) {
            std::cerr << "Usage: generate_ast <output directory>\n";
            return LOX_EXIT_USAGE;
        }

        try {
            writeAst(parseResult["outdir"].as<std::string>(), "Expr", exprSpecs);
        } catch (AstSpecError& e) {
            reportError(std::cerr, e);
            return LOX_EXIT_DATAERR;
        } catch (std::runtime_error& e) {
            reportError(std::cerr, e);
            return LOX_EXIT_IOERR;
        }

        return 0;
    }
}

int main(int argc, char* argv[]) {
    return lox::generate(argc, argv);
}
