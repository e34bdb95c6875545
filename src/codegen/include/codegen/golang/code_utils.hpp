#pragma once

#include "codegen/import_filter.hpp"
#include "codegen/result.hpp"
#include "frontend/program.hpp"
#include "frontend/semantic/type_resolver.hpp"
#include "idl/ast.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace kestrel::codegen::golang
{

struct ScopeInclude {
    std::string alias;                          ///< include alias used in the IDL, e.g. "base"
    const frontend::SourceFile* file = nullptr;
};

/**
 * @brief Naming context of one IDL file.
 */
struct Scope {
    const frontend::SourceFile* file = nullptr;
    std::string namespace_name;  ///< Go namespace, or the reference name of the file
    std::string package;         ///< Go package name
    std::string import_path;     ///< import path of the package
    std::vector<ScopeInclude> includes;
};

/**
 * @brief Go naming rules and type predicates.
 *
 * Type predicates resolve user types against the root scope, which has to be
 * set with set_root_scope() before they are used.
 */
class CodeUtils
{
public:
    CodeUtils(const frontend::Program& program, std::string package_prefix);

    Result<Scope> build_scope(const frontend::SourceFile& file) const;

    void set_root_scope(const Scope& scope);

    const Scope* root_scope() const
    {
        return _root ? &*_root : nullptr;
    }

    /**
     * @brief Imports needed by the file of the root scope.
     *
     * Contains the imports of the base stubs of the file and one import per
     * included package. Colliding package names get an alias.
     */
    Result<ImportMap> resolve_imports() const;

    /**
     * @brief "namespace go" of the file, "*" namespace, or the base name of the file.
     */
    std::string namespace_or_reference_name(const frontend::SourceFile& file) const;

    std::string import_path_of(const std::string& namespace_name) const;

    /**
     * @brief Relative output path: namespace "a.b" of "x/svc.thrift" -> "a/b/svc.go".
     */
    Result<std::filesystem::path> get_file_path(const frontend::SourceFile& file) const;

    Result<bool> is_fixed_length_type(const idl::ast::Type& type) const;
    Result<bool> is_binary_type(const idl::ast::Type& type) const;
    Result<bool> is_string_type(const idl::ast::Type& type) const;

    /**
     * @brief Wire type constant of @p type, e.g. "thrift.I64" or "thrift.STRUCT".
     */
    Result<std::string> wire_type(const idl::ast::Type& type) const;

    static std::string namespace_to_package(const std::string& namespace_name);
    static bool is_valid_package_name(const std::string& name);

private:
    /**
     * @brief A type with its typedefs stripped, and the file it is written in.
     *
     * @c definition is set when the type names an enum or a struct-like.
     */
    struct Located {
        const idl::ast::Type* type = nullptr;
        const frontend::SourceFile* file = nullptr;
        const idl::ast::Definition* definition = nullptr;
    };

    Result<const Scope*> require_root() const;
    Result<frontend::semantic::ResolvedType> resolve(const idl::ast::UserType& type,
                                                     const frontend::SourceFile& file) const;
    Result<Located> strip_typedefs(const idl::ast::Type& type, const frontend::SourceFile& file) const;
    Result<bool> is_fixed_length(const idl::ast::Type& type,
                                 const frontend::SourceFile& file,
                                 std::vector<const idl::ast::Definition*>& visiting) const;
    Result<bool> is_base_kind(const idl::ast::Type& type, idl::ast::BaseKind kind) const;

    const frontend::Program& _program;
    frontend::semantic::TypeResolver _resolver;
    std::string _package_prefix;
    std::optional<Scope> _root;
};

/**
 * @brief snake_case or camelCase to CamelCase: "base_resp" -> "BaseResp".
 */
std::string camel_case(const std::string& name);

/**
 * @brief Go name of an exported identifier: "base_resp" -> "BaseResp".
 */
std::string export_name(const std::string& name);

/**
 * @brief Go name of an unexported identifier: "BaseResp" -> "baseResp".
 */
std::string unexport(const std::string& name);

}  // namespace kestrel::codegen::golang
