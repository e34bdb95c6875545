#pragma once

#include "codegen/envelope_extractor.hpp"
#include "codegen/import_filter.hpp"
#include "codegen/result.hpp"
#include "frontend/source_file.hpp"
#include "idl/ast.hpp"

#include <functional>
#include <map>
#include <ostream>
#include <string>
#include <vector>

namespace kestrel::codegen
{

/**
 * @brief Data a file is rendered from.
 */
struct FileData {
    const frontend::SourceFile* ast = nullptr;
    std::string package;
    ImportMap imports;  ///< already filtered
};

/**
 * @brief Helper operations templates may call.
 */
struct FuncMap {
    std::function<Result<std::vector<const idl::ast::Field*>>(const std::vector<idl::ast::Field>&)>
        reorder_struct_fields;
    std::function<std::string(const std::string&)> type_id_to_go_type;
    std::function<EnvelopeMatch(const idl::ast::Document&)> filter_base;
    std::function<Result<bool>(const idl::ast::Type&)> is_binary_or_string_type;
    std::function<std::vector<std::string>(const ImportMap&)> to_package_names;
    std::function<std::string()> version;
    std::function<bool()> generate_fast_apis;
    std::function<std::string(const std::string&)> go_name;
    std::function<Result<std::string>(const idl::ast::Type&)> wire_type;
};

class TemplateSet;

/**
 * @brief What a template sees: the file data, the helpers, the other templates,
 *        and the record or field a sub-template was invoked for.
 */
struct RenderContext {
    const FileData* data = nullptr;
    const FuncMap* funcs = nullptr;
    const TemplateSet* templates = nullptr;
    const idl::ast::StructLike* record = nullptr;
    const idl::ast::Field* field = nullptr;

    RenderContext with_record(const idl::ast::StructLike& r) const
    {
        auto copy = *this;
        copy.record = &r;
        copy.field = nullptr;
        return copy;
    }

    RenderContext with_field(const idl::ast::Field& f) const
    {
        auto copy = *this;
        copy.field = &f;
        return copy;
    }
};

/**
 * @brief Named templates, executable by name and able to call each other.
 */
class TemplateSet
{
public:
    using Template = std::function<Result<void>(const RenderContext&, std::ostream&)>;

    void define(const std::string& name, Template tpl);
    bool contains(const std::string& name) const;

    /**
     * @brief Render template @p name into @p os. Unknown names are a render error.
     */
    Result<void> execute(const std::string& name, const RenderContext& context, std::ostream& os) const;

private:
    std::map<std::string, Template> _templates;
};

/**
 * @brief Type id of a base type: "Bool", "Byte", "I16", "I32", "I64", "Double", "String" or "Binary".
 */
std::string type_id_of(idl::ast::BaseKind kind);

/**
 * @brief Go type of a type id, or an empty string for an unknown id.
 */
std::string type_id_to_go_type(const std::string& type_id);

/**
 * @brief Package names the imports are referred to by: the alias, or the
 *        lower-cased last path segment. Sorted.
 */
std::vector<std::string> to_package_names(const ImportMap& imports);

}  // namespace kestrel::codegen
