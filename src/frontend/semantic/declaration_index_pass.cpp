#include "declaration_index_pass.hpp"

#include "semantic_context.hpp"

#include <boost/variant/apply_visitor.hpp>

#include <unordered_map>

namespace kestrel::frontend::semantic
{

void DeclarationIndexPass::run(Context& context)
{
    for (const auto& [_, file] : context.program().files) {
        std::unordered_map<std::string, const ast::Definition*> declared;

        for (const auto& definition : file.document.definitions) {
            const auto& name = definition_name(definition);
            auto [it, inserted] = declared.emplace(name, &definition);
            if (!inserted) {
                boost::apply_visitor(
                    [&](const auto& node) {
                        context.report_error(file, node,
                                             "Declaration '" + name + "' already defined in " + file.path);
                    },
                    definition);
            }
        }
    }
}

}  // namespace kestrel::frontend::semantic
