#include "idl/ast.hpp"

#include <boost/variant/get.hpp>

namespace kestrel::idl::ast
{

std::vector<const Include*> includes_of(const Document& document)
{
    std::vector<const Include*> out;
    for (const auto& header : document.headers) {
        if (const auto* include = boost::get<Include>(&header)) {
            out.push_back(include);
        }
    }
    return out;
}

std::optional<std::string> namespace_of(const Document& document, const std::string& language)
{
    std::optional<std::string> wildcard;
    for (const auto& header : document.headers) {
        if (const auto* ns = boost::get<Namespace>(&header)) {
            if (ns->language == language) {
                return ns->name.to_string();
            }
            if (ns->language == "*" && !wildcard) {
                wildcard = ns->name.to_string();
            }
        }
    }
    return wildcard;
}

std::vector<const StructLike*> struct_likes_of(const Document& document)
{
    std::vector<const StructLike*> out;
    for (const auto& definition : document.definitions) {
        if (const auto* s = boost::get<StructLike>(&definition)) {
            out.push_back(s);
        }
    }
    return out;
}

std::vector<const Service*> services_of(const Document& document)
{
    std::vector<const Service*> out;
    for (const auto& definition : document.definitions) {
        if (const auto* s = boost::get<Service>(&definition)) {
            out.push_back(s);
        }
    }
    return out;
}

std::string to_string(BaseKind kind)
{
    switch (kind) {
        case BaseKind::Bool:
            return "bool";
        case BaseKind::Byte:
            return "byte";
        case BaseKind::I8:
            return "i8";
        case BaseKind::I16:
            return "i16";
        case BaseKind::I32:
            return "i32";
        case BaseKind::I64:
            return "i64";
        case BaseKind::Double:
            return "double";
        case BaseKind::String:
            return "string";
        case BaseKind::Binary:
            return "binary";
    }
    return "<unknown>";
}

std::string to_string(StructKind kind)
{
    switch (kind) {
        case StructKind::Struct:
            return "struct";
        case StructKind::Union:
            return "union";
        case StructKind::Exception:
            return "exception";
    }
    return "<unknown>";
}

}  // namespace kestrel::idl::ast
