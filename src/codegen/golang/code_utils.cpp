#include "codegen/golang/code_utils.hpp"

#include <boost/variant/get.hpp>

#include <algorithm>
#include <array>
#include <cctype>
#include <string_view>
#include <utility>

namespace kestrel::codegen::golang
{

namespace
{

namespace ast = idl::ast;

// imports of the base stubs generated for every IDL file
constexpr std::array<const char*, 5> kBaseImports{
    "bytes", "context", "fmt", "strings", kLegacyThriftRuntime,
};

// package names the file template imports on its own
constexpr std::array<const char*, 2> kTemplatePackages{"bthrift", "reflect"};

constexpr std::array<std::string_view, 25> kGoKeywords{
    "break",  "case",   "chan",   "const", "continue", "default", "defer",     "else", "fallthrough",
    "for",    "func",   "go",     "goto",  "if",       "import",  "interface", "map",  "package",
    "range",  "return", "select", "struct", "switch",  "type",    "var",
};

std::vector<std::string> split_dotted(const std::string& name)
{
    std::vector<std::string> parts;
    std::string::size_type begin = 0;
    for (auto dot = name.find('.'); dot != std::string::npos; dot = name.find('.', begin)) {
        parts.push_back(name.substr(begin, dot - begin));
        begin = dot + 1;
    }
    parts.push_back(name.substr(begin));
    return parts;
}

std::string last_path_segment(const std::string& path)
{
    const auto slash = path.rfind('/');
    return slash == std::string::npos ? path : path.substr(slash + 1);
}

std::string to_lower(std::string text)
{
    std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return text;
}

}  // namespace

CodeUtils::CodeUtils(const frontend::Program& program, std::string package_prefix)
    : _program(program)
    , _resolver(program)
    , _package_prefix(std::move(package_prefix))
{
}

Result<Scope> CodeUtils::build_scope(const frontend::SourceFile& file) const
{
    Scope scope;
    scope.file = &file;
    scope.namespace_name = namespace_or_reference_name(file);
    scope.package = namespace_to_package(scope.namespace_name);
    if (!is_valid_package_name(scope.package)) {
        return unexpected_result<Scope>(ErrorKind::ScopeResolution,
                                        "invalid Go package name '" + scope.package + "' for namespace '" +
                                            scope.namespace_name + "'");
    }
    scope.import_path = import_path_of(scope.namespace_name);

    for (const auto& include : file.includes) {
        const auto* target = _program.find(include.path);
        if (target == nullptr) {
            return unexpected_result<Scope>(ErrorKind::ScopeResolution,
                                            "included file '" + include.path + "' is not loaded");
        }
        scope.includes.push_back(ScopeInclude{include.alias, target});
    }
    return scope;
}

void CodeUtils::set_root_scope(const Scope& scope)
{
    _root = scope;
}

Result<ImportMap> CodeUtils::resolve_imports() const
{
    auto root = require_root();
    if (!root) {
        return std::unexpected(root.error());
    }
    const Scope& scope = **root;

    ImportMap imports;
    std::map<std::string, std::string> names;  // package name in use -> import path
    for (const char* path : kBaseImports) {
        imports.emplace(path, "");
        names.emplace(last_path_segment(path), path);
    }
    for (const char* package : kTemplatePackages) {
        names.emplace(package, "");
    }

    for (const auto& include : scope.includes) {
        const auto namespace_name = namespace_or_reference_name(*include.file);
        const auto package = namespace_to_package(namespace_name);
        if (!is_valid_package_name(package)) {
            return unexpected_result<ImportMap>(ErrorKind::ImportResolution,
                                                "include '" + include.alias + "' (" + include.file->path +
                                                    ") has no valid Go package name");
        }

        auto path = import_path_of(namespace_name);
        if (path == scope.import_path || imports.contains(path)) {
            continue;
        }

        std::string name = package;
        for (int n = 0; names.contains(name); ++n) {
            name = package + std::to_string(n);
        }
        names.emplace(name, path);
        imports.emplace(path, name == to_lower(last_path_segment(path)) ? std::string{} : name);
    }
    return imports;
}

std::string CodeUtils::namespace_or_reference_name(const frontend::SourceFile& file) const
{
    if (auto ns = ast::namespace_of(file.document, "go")) {
        return *ns;
    }
    return file.reference_name();
}

std::string CodeUtils::import_path_of(const std::string& namespace_name) const
{
    auto path = namespace_name;
    std::replace(path.begin(), path.end(), '.', '/');
    return _package_prefix.empty() ? path : _package_prefix + "/" + path;
}

Result<std::filesystem::path> CodeUtils::get_file_path(const frontend::SourceFile& file) const
{
    const auto namespace_name = namespace_or_reference_name(file);
    std::filesystem::path path;
    for (const auto& part : split_dotted(namespace_name)) {
        if (part.empty()) {
            return unexpected_result<std::filesystem::path>(
                ErrorKind::ScopeResolution, "malformed namespace '" + namespace_name + "' in " + file.path);
        }
        path /= part;
    }
    return path / (file.reference_name() + ".go");
}

Result<bool> CodeUtils::is_fixed_length_type(const ast::Type& type) const
{
    auto root = require_root();
    if (!root) {
        return std::unexpected(root.error());
    }
    std::vector<const ast::Definition*> visiting;
    return is_fixed_length(type, *(*root)->file, visiting);
}

Result<bool> CodeUtils::is_binary_type(const ast::Type& type) const
{
    return is_base_kind(type, ast::BaseKind::Binary);
}

Result<bool> CodeUtils::is_string_type(const ast::Type& type) const
{
    return is_base_kind(type, ast::BaseKind::String);
}

Result<std::string> CodeUtils::wire_type(const ast::Type& type) const
{
    auto root = require_root();
    if (!root) {
        return std::unexpected(root.error());
    }
    auto located = strip_typedefs(type, *(*root)->file);
    if (!located) {
        return std::unexpected(located.error());
    }

    if (located->definition != nullptr) {
        if (boost::get<ast::Enum>(located->definition) != nullptr) {
            return std::string("thrift.I32");
        }
        return std::string("thrift.STRUCT");
    }

    if (const auto* base = boost::get<ast::BaseType>(located->type)) {
        switch (base->kind) {
            case ast::BaseKind::Bool:
                return std::string("thrift.BOOL");
            case ast::BaseKind::Byte:
            case ast::BaseKind::I8:
                return std::string("thrift.BYTE");
            case ast::BaseKind::I16:
                return std::string("thrift.I16");
            case ast::BaseKind::I32:
                return std::string("thrift.I32");
            case ast::BaseKind::I64:
                return std::string("thrift.I64");
            case ast::BaseKind::Double:
                return std::string("thrift.DOUBLE");
            case ast::BaseKind::String:
            case ast::BaseKind::Binary:
                return std::string("thrift.STRING");
        }
    }
    if (boost::get<ast::ListType>(located->type) != nullptr) {
        return std::string("thrift.LIST");
    }
    if (boost::get<ast::SetType>(located->type) != nullptr) {
        return std::string("thrift.SET");
    }
    return std::string("thrift.MAP");
}

std::string CodeUtils::namespace_to_package(const std::string& namespace_name)
{
    auto package = to_lower(split_dotted(namespace_name).back());
    std::replace_if(
        package.begin(), package.end(),
        [](unsigned char c) {
            return !std::isalnum(c) && c != '_';
        },
        '_');
    return package;
}

bool CodeUtils::is_valid_package_name(const std::string& name)
{
    if (name.empty() || name == "_" || std::isdigit(static_cast<unsigned char>(name.front()))) {
        return false;
    }
    return std::find(kGoKeywords.begin(), kGoKeywords.end(), name) == kGoKeywords.end();
}

Result<const Scope*> CodeUtils::require_root() const
{
    if (!_root) {
        return unexpected_result<const Scope*>(ErrorKind::ScopeResolution, "no root scope set");
    }
    return &*_root;
}

Result<frontend::semantic::ResolvedType> CodeUtils::resolve(const ast::UserType& type,
                                                            const frontend::SourceFile& file) const
{
    auto resolved = _resolver.resolve(type, file);
    if (!resolved) {
        return unexpected_result<frontend::semantic::ResolvedType>(ErrorKind::TypeClassification,
                                                                   resolved.error());
    }
    return *resolved;
}

Result<CodeUtils::Located> CodeUtils::strip_typedefs(const ast::Type& type, const frontend::SourceFile& file) const
{
    Located located{&type, &file, nullptr};
    std::vector<const ast::Definition*> seen;

    while (const auto* user = boost::get<ast::UserType>(located.type)) {
        auto resolved = resolve(*user, *located.file);
        if (!resolved) {
            return std::unexpected(resolved.error());
        }
        const auto* typedef_decl = boost::get<ast::Typedef>(resolved->definition);
        if (typedef_decl == nullptr) {
            located.definition = resolved->definition;
            located.file = resolved->file;
            break;
        }
        if (std::find(seen.begin(), seen.end(), resolved->definition) != seen.end()) {
            return unexpected_result<Located>(ErrorKind::TypeClassification,
                                              "cyclic typedef '" + typedef_decl->name + "'");
        }
        seen.push_back(resolved->definition);
        located.type = &typedef_decl->type;
        located.file = resolved->file;
    }
    return located;
}

Result<bool> CodeUtils::is_fixed_length(const ast::Type& type,
                                        const frontend::SourceFile& file,
                                        std::vector<const ast::Definition*>& visiting) const
{
    auto located = strip_typedefs(type, file);
    if (!located) {
        return std::unexpected(located.error());
    }

    if (located->definition == nullptr) {
        const auto* base = boost::get<ast::BaseType>(located->type);
        if (base == nullptr) {
            return false;  // containers
        }
        return base->kind != ast::BaseKind::String && base->kind != ast::BaseKind::Binary;
    }

    if (boost::get<ast::Enum>(located->definition) != nullptr) {
        return true;
    }

    const auto* record = boost::get<ast::StructLike>(located->definition);
    if (record == nullptr) {
        return unexpected_result<bool>(ErrorKind::TypeClassification,
                                       "'" + frontend::semantic::definition_name(*located->definition) +
                                           "' does not name a type");
    }
    if (record->kind == ast::StructKind::Union) {
        return false;
    }
    // a record reachable from itself has no static length
    if (std::find(visiting.begin(), visiting.end(), located->definition) != visiting.end()) {
        return false;
    }

    // every field is classified, so the result and any error do not depend on field order
    visiting.push_back(located->definition);
    bool all_fixed = true;
    for (const auto& field : record->fields) {
        auto fixed = is_fixed_length(field.type, *located->file, visiting);
        if (!fixed) {
            visiting.pop_back();
            return fixed;
        }
        all_fixed = all_fixed && *fixed;
    }
    visiting.pop_back();
    return all_fixed;
}

Result<bool> CodeUtils::is_base_kind(const ast::Type& type, ast::BaseKind kind) const
{
    auto root = require_root();
    if (!root) {
        return std::unexpected(root.error());
    }
    auto located = strip_typedefs(type, *(*root)->file);
    if (!located) {
        return std::unexpected(located.error());
    }
    const auto* base = boost::get<ast::BaseType>(located->type);
    return base != nullptr && base->kind == kind;
}

std::string camel_case(const std::string& name)
{
    std::string out;
    out.reserve(name.size());
    bool upper_next = true;
    for (char c : name) {
        if (c == '_') {
            upper_next = true;
            continue;
        }
        out.push_back(upper_next ? static_cast<char>(std::toupper(static_cast<unsigned char>(c))) : c);
        upper_next = false;
    }
    return out.empty() ? name : out;
}

std::string export_name(const std::string& name)
{
    return camel_case(name);
}

std::string unexport(const std::string& name)
{
    auto out = camel_case(name);
    if (!out.empty()) {
        out.front() = static_cast<char>(std::tolower(static_cast<unsigned char>(out.front())));
    }
    return out;
}

}  // namespace kestrel::codegen::golang
