#ifndef _ASTGEN_H_
#define _ASTGEN_H_

#include <filesystem>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace lox {
    // AstSpecError is thrown when a node specification is malformed.
    class AstSpecError : public std::invalid_argument {
    public:
        AstSpecError(const std::string& message)
        : std::invalid_argument(message)
        {}
    };

    // FieldSpec describes a single field of an AST node.
    struct FieldSpec {
        std::string type;
        std::string name;
    };

    // NodeSpec describes one AST node variant.
    struct NodeSpec {
        std::string name;
        std::vector<FieldSpec> fields;
    };

    // parseNodeSpec parses a node specification of the form
    // `Name : Type field, Type field`.
    NodeSpec parseNodeSpec(std::string_view spec);

    // defineAst returns the text of a C++ header declaring the node variants
    // described by `specs`, their abstract base class `baseName` and a visitor
    // with one dispatch method per variant.  Each variant class is named after
    // the variant with `baseName` appended, eg. `BinaryExpr`.
    std::string defineAst(std::string_view baseName, const std::vector<std::string>& specs);

    // writeAst writes the header produced by `defineAst` to
    // `<outputDir>/<lowercase baseName>.hpp` and returns the path written.
    std::filesystem::path writeAst(
        const std::filesystem::path& outputDir,
        std::string_view baseName,
        const std::vector<std::string>& specs
    );
}

#endif
