#include "frontend/semantic/type_resolver.hpp"

#include <boost/variant/apply_visitor.hpp>
#include <boost/variant/get.hpp>

namespace kestrel::frontend::semantic
{

const std::string& definition_name(const ast::Definition& definition)
{
    return boost::apply_visitor([](const auto& node) -> const std::string& { return node.name; }, definition);
}

TypeResolver::TypeResolver(const Program& program)
    : program_(program)
{
    for (const auto& [_, file] : program_.files) {
        auto& file_index = index_[&file];
        for (const auto& definition : file.document.definitions) {
            // first declaration wins, duplicates are reported by DeclarationIndexPass
            file_index.emplace(definition_name(definition), &definition);
        }
    }
}

const ast::Definition* TypeResolver::find(const SourceFile& file, const std::string& name) const
{
    auto file_it = index_.find(&file);
    if (file_it == index_.end()) {
        return nullptr;
    }
    auto it = file_it->second.find(name);
    return it == file_it->second.end() ? nullptr : it->second;
}

std::expected<ResolvedType, std::string> TypeResolver::resolve(const ast::QualifiedIdentifier& name,
                                                               const SourceFile& scope) const
{
    const SourceFile* target = &scope;
    std::string local_name;

    if (name.parts.size() == 1) {
        local_name = name.parts.front();
    } else if (name.parts.size() == 2) {
        const auto* include = scope.find_include(name.parts.front());
        if (include == nullptr) {
            return std::unexpected("Unknown include '" + name.parts.front() + "' in type '" + name.to_string() +
                                   "'");
        }
        target = program_.find(include->path);
        if (target == nullptr) {
            return std::unexpected("Included file '" + include->path + "' is not loaded");
        }
        local_name = name.parts.back();
    } else {
        return std::unexpected("Malformed type name '" + name.to_string() + "'");
    }

    const auto* definition = find(*target, local_name);
    if (definition == nullptr) {
        return std::unexpected("Unknown type '" + name.to_string() + "'");
    }
    if (boost::get<ast::Constant>(definition) || boost::get<ast::Service>(definition)) {
        return std::unexpected("'" + name.to_string() + "' does not name a type");
    }
    return ResolvedType{target, definition};
}

}  // namespace kestrel::frontend::semantic
