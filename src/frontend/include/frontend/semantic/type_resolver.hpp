#pragma once

#include "frontend/program.hpp"
#include "idl/ast.hpp"

#include <expected>
#include <string>
#include <unordered_map>

namespace kestrel::frontend::semantic
{

namespace ast = idl::ast;

struct ResolvedType {
    const SourceFile* file = nullptr;              ///< File declaring the type
    const ast::Definition* definition = nullptr;  ///< Typedef, enum or struct-like
};

/**
 * @brief Maps type references to their declarations.
 *
 * A reference is either a bare name declared in the referencing file or
 * "<include>.<Name>" where <include> is the base name of an included file.
 */
class TypeResolver
{
public:
    explicit TypeResolver(const Program& program);

    std::expected<ResolvedType, std::string> resolve(const ast::QualifiedIdentifier& name,
                                                     const SourceFile& scope) const;

    std::expected<ResolvedType, std::string> resolve(const ast::UserType& type, const SourceFile& scope) const
    {
        return resolve(type.name, scope);
    }

    /**
     * @brief Declaration named @p name in @p file, of any kind, or nullptr.
     */
    const ast::Definition* find(const SourceFile& file, const std::string& name) const;

    const Program& program() const
    {
        return program_;
    }

private:
    using FileIndex = std::unordered_map<std::string, const ast::Definition*>;

    const Program& program_;
    std::unordered_map<const SourceFile*, FileIndex> index_;
};

/**
 * @brief Declared name of a top-level definition.
 */
const std::string& definition_name(const ast::Definition& definition);

}  // namespace kestrel::frontend::semantic
