#include "astgen.hpp"

#include <fstream>

#include "boost/algorithm/string.hpp"
#include "boost/format.hpp"

namespace balgo = boost::algorithm;

namespace lox {
    NodeSpec parseNodeSpec(std::string_view spec) {
        std::string text { spec };

        auto colon = text.find(':');
        if (colon == std::string::npos)
            throw AstSpecError((boost::format("missing `:` in node spec `%1%`") % text).str());

        NodeSpec node;
        node.name = balgo::trim_copy(text.substr(0, colon));
        if (node.name.empty())
            throw AstSpecError((boost::format("missing node name in node spec `%1%`") % text).str());

        std::string fieldList = balgo::trim_copy(text.substr(colon + 1));
        if (fieldList.empty())
            return node;

        std::vector<std::string> fields;
        balgo::split(fields, fieldList, balgo::is_any_of(","));

        for (auto& field : fields) {
            balgo::trim(field);

            // Each field is a type followed by a name.
            std::vector<std::string> parts;
            balgo::split(parts, field, balgo::is_space(), balgo::token_compress_on);
            if (parts.size() != 2 || parts[0].empty())
                throw AstSpecError((boost::format("malformed field `%1%` in node `%2%`") % field % node.name).str());

            node.fields.push_back({ parts[0], parts[1] });
        }

        return node;
    }

    /* ---------------------------------------------------------------------- */

    // fieldType returns the C++ type a field of spec type `type` is stored as.
    // Child nodes are owned by their parent.
    static std::string fieldType(const std::string& baseName, const std::string& type) {
        if (type == baseName)
            return "std::unique_ptr<" + baseName + ">";

        return type;
    }

    // defineVisitor appends the visitor class to `out`.
    static void defineVisitor(std::string& out, const std::string& baseName, const std::vector<NodeSpec>& nodes) {
        std::string paramName = balgo::to_lower_copy(baseName);

        out += (boost::format("    // %1%Visitor dispatches over every kind of %1% node.\n") % baseName).str();
        out += (boost::format("    class %1%Visitor {\n") % baseName).str();
        out += "    public:\n";
        out += (boost::format("        virtual ~%1%Visitor() = default;\n\n") % baseName).str();

        for (auto& node : nodes) {
            out += (
                boost::format("        virtual void visit%1%%2%(%1%%2%& %3%) = 0;\n")
                % node.name % baseName % paramName
            ).str();
        }

        out += "    };\n\n";
    }

    // defineType appends the class for the node variant `node` to `out`.
    static void defineType(std::string& out, const std::string& baseName, const NodeSpec& node) {
        std::string className = node.name + baseName;

        out += (boost::format("    class %1% : public %2% {\n") % className % baseName).str();
        out += "    public:\n";

        // The constructor takes every field by value and moves it into place.
        std::string params;
        for (auto& field : node.fields) {
            if (!params.empty())
                params += ", ";

            params += fieldType(baseName, field.type) + " " + field.name;
        }

        out += (boost::format("        %1%(%2%)\n") % className % params).str();
        for (size_t i = 0; i < node.fields.size(); i++) {
            auto& name = node.fields[i].name;
            out += (boost::format("        %1% %2%(std::move(%2%))\n") % (i == 0 ? ':' : ',') % name).str();
        }
        out += "        {}\n\n";

        // The visitor entry point.
        out += (boost::format("        void accept(%1%Visitor& visitor) override {\n") % baseName).str();
        out += (boost::format("            visitor.visit%1%(*this);\n") % className).str();
        out += "        }\n";

        if (!node.fields.empty())
            out += "\n";

        for (auto& field : node.fields)
            out += (boost::format("        %1% %2%;\n") % fieldType(baseName, field.type) % field.name).str();

        out += "    };\n";
    }

    std::string defineAst(std::string_view baseName, const std::vector<std::string>& specs) {
        std::string base { baseName };

        std::vector<NodeSpec> nodes;
        for (auto& spec : specs)
            nodes.push_back(parseNodeSpec(spec));

        std::string guard = "_" + balgo::to_upper_copy(base) + "_H_";

        std::string out;
        out += (boost::format("#ifndef %1%\n#define %1%\n\n") % guard).str();
        out += "// Generated by generate_ast.  Do not edit.\n\n";
        out += "#include <memory>\n#include <utility>\n\n";
        out += "#include \"syntax/token.hpp\"\n\n";
        out += "namespace lox {\n";

        for (auto& node : nodes)
            out += (boost::format("    class %1%%2%;\n") % node.name % base).str();
        out += "\n";

        defineVisitor(out, base, nodes);

        out += (boost::format("    // %1% is the base class of all %1% nodes.\n") % base).str();
        out += (boost::format("    class %1% {\n") % base).str();
        out += "    public:\n";
        out += (boost::format("        virtual ~%1%() = default;\n\n") % base).str();
        out += "        // accept dispatches to the visitor method for the node's variant.\n";
        out += (boost::format("        virtual void accept(%1%Visitor& visitor) = 0;\n") % base).str();
        out += "    };\n";

        for (auto& node : nodes) {
            out += "\n";
            defineType(out, base, node);
        }

        out += "}\n\n#endif\n";
        return out;
    }

    std::filesystem::path writeAst(
        const std::filesystem::path& outputDir,
        std::string_view baseName,
        const std::vector<std::string>& specs
    ) {
        // Build the text first so a bad spec never leaves a partial file behind.
        std::string text = defineAst(baseName, specs);

        auto path = outputDir / (balgo::to_lower_copy(std::string(baseName)) + ".hpp");

        std::ofstream outf { path };
        if (!outf)
            throw std::runtime_error((boost::format("could not open `%1%` for writing") % path.string()).str());

        outf << text;
        if (!outf)
            throw std::runtime_error((boost::format("could not write `%1%`") % path.string()).str());

        return path;
    }
}
