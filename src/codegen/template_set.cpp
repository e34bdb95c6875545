#include "codegen/template_set.hpp"

#include <algorithm>
#include <cctype>
#include <unordered_map>
#include <utility>

namespace kestrel::codegen
{

void TemplateSet::define(const std::string& name, Template tpl)
{
    _templates.insert_or_assign(name, std::move(tpl));
}

bool TemplateSet::contains(const std::string& name) const
{
    return _templates.contains(name);
}

Result<void> TemplateSet::execute(const std::string& name, const RenderContext& context, std::ostream& os) const
{
    auto it = _templates.find(name);
    if (it == _templates.end()) {
        return unexpected_result(ErrorKind::Render, "no template named '" + name + "'");
    }
    auto nested = context;
    nested.templates = this;
    return it->second(nested, os);
}

std::string type_id_of(idl::ast::BaseKind kind)
{
    using idl::ast::BaseKind;
    switch (kind) {
        case BaseKind::Bool:
            return "Bool";
        case BaseKind::Byte:
        case BaseKind::I8:
            return "Byte";
        case BaseKind::I16:
            return "I16";
        case BaseKind::I32:
            return "I32";
        case BaseKind::I64:
            return "I64";
        case BaseKind::Double:
            return "Double";
        case BaseKind::String:
            return "String";
        case BaseKind::Binary:
            return "Binary";
    }
    return {};
}

std::string type_id_to_go_type(const std::string& type_id)
{
    static const std::unordered_map<std::string, std::string> go_types{
        {"Bool", "bool"},   {"Byte", "int8"},       {"I16", "int16"},     {"I32", "int32"},
        {"I64", "int64"},   {"Double", "float64"},  {"String", "string"}, {"Binary", "[]byte"},
    };
    auto it = go_types.find(type_id);
    return it == go_types.end() ? std::string{} : it->second;
}

std::vector<std::string> to_package_names(const ImportMap& imports)
{
    std::vector<std::string> names;
    names.reserve(imports.size());
    for (const auto& [path, alias] : imports) {
        if (!alias.empty()) {
            names.push_back(alias);
            continue;
        }
        auto slash = path.rfind('/');
        auto name = slash == std::string::npos ? path : path.substr(slash + 1);
        std::transform(name.begin(), name.end(), name.begin(), [](unsigned char c) {
            return static_cast<char>(std::tolower(c));
        });
        names.push_back(std::move(name));
    }
    std::sort(names.begin(), names.end());
    return names;
}

}  // namespace kestrel::codegen
