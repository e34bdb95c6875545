#include "idl/json_dump.hpp"

#include <boost/variant/apply_visitor.hpp>
#include <boost/variant/get.hpp>
#include <boost/variant/static_visitor.hpp>

#include <nlohmann/json.hpp>

namespace kestrel::idl::ast
{
namespace
{

using nlohmann::json;

std::string requiredness_to_string(Requiredness requiredness)
{
    switch (requiredness) {
        case Requiredness::Default:
            return "default";
        case Requiredness::Required:
            return "required";
        case Requiredness::Optional:
            return "optional";
    }
    return "<unknown>";
}

json constant_to_json(const ConstantValue& value)
{
    struct Visitor : boost::static_visitor<json> {
        Visitor() = default;

        json operator()(bool v) const
        {
            return v;
        }

        json operator()(std::int64_t v) const
        {
            return v;
        }

        json operator()(double v) const
        {
            return v;
        }

        json operator()(const std::string& v) const
        {
            return v;
        }

        json operator()(const QualifiedIdentifier& ident) const
        {
            return json{{"ref", ident.to_string()}};
        }
    };

    return boost::apply_visitor(Visitor{}, value);
}

json annotations_to_json(const AnnotationList& annotations)
{
    json obj = json::object();
    for (const auto& annotation : annotations) {
        obj[annotation.key] = annotation.value;
    }
    return obj;
}

json type_to_json(const Type& type)
{
    struct Visitor : boost::static_visitor<json> {
        Visitor() = default;

        json operator()(const BaseType& base) const
        {
            return json{{"kind", "base"}, {"name", to_string(base.kind)}};
        }

        json operator()(const UserType& user_type) const
        {
            return json{{"kind", "user"}, {"name", user_type.name.to_string()}};
        }

        json operator()(const ListType& list) const
        {
            return json{{"kind", "list"}, {"element", type_to_json(list.element)}};
        }

        json operator()(const SetType& set) const
        {
            return json{{"kind", "set"}, {"element", type_to_json(set.element)}};
        }

        json operator()(const MapType& map) const
        {
            return json{{"kind", "map"}, {"key", type_to_json(map.key)}, {"value", type_to_json(map.value)}};
        }
    };

    return boost::apply_visitor(Visitor{}, type);
}

json fields_to_json(const std::vector<Field>& fields)
{
    json arr = json::array();
    for (const auto& field : fields) {
        json node;
        node["id"] = field.id;
        node["name"] = field.name;
        node["requiredness"] = requiredness_to_string(field.requiredness);
        node["type"] = type_to_json(field.type);
        if (field.default_value) {
            node["default"] = constant_to_json(*field.default_value);
        }
        if (!field.annotations.empty()) {
            node["annotations"] = annotations_to_json(field.annotations);
        }
        arr.push_back(std::move(node));
    }
    return arr;
}

json definition_to_json(const Definition& definition)
{
    struct Visitor : boost::static_visitor<json> {
        Visitor() = default;

        json operator()(const Typedef& t) const
        {
            return json{{"kind", "typedef"}, {"name", t.name}, {"type", type_to_json(t.type)}};
        }

        json operator()(const Constant& constant) const
        {
            return json{{"kind", "const"},
                        {"name", constant.name},
                        {"type", type_to_json(constant.type)},
                        {"value", constant_to_json(constant.value)}};
        }

        json operator()(const Enum& e) const
        {
            json values = json::array();
            for (const auto& value : e.values) {
                json entry;
                entry["name"] = value.name;
                if (value.value) {
                    entry["value"] = *value.value;
                }
                values.push_back(std::move(entry));
            }
            return json{{"kind", "enum"}, {"name", e.name}, {"values", std::move(values)}};
        }

        json operator()(const StructLike& s) const
        {
            json node{{"kind", to_string(s.kind)}, {"name", s.name}, {"fields", fields_to_json(s.fields)}};
            if (!s.annotations.empty()) {
                node["annotations"] = annotations_to_json(s.annotations);
            }
            return node;
        }

        json operator()(const Service& service) const
        {
            json node{{"kind", "service"}, {"name", service.name}};
            if (service.extends) {
                node["extends"] = service.extends->to_string();
            }
            json functions = json::array();
            for (const auto& function : service.functions) {
                json entry;
                entry["name"] = function.name;
                entry["oneway"] = function.oneway;
                entry["result"] = function.result.is_void ? json("void") : type_to_json(function.result.type);
                entry["arguments"] = fields_to_json(function.arguments);
                entry["throws"] = fields_to_json(function.throws);
                functions.push_back(std::move(entry));
            }
            node["functions"] = std::move(functions);
            return node;
        }
    };

    return boost::apply_visitor(Visitor{}, definition);
}

}  // namespace

nlohmann::json to_json(const Document& document)
{
    json node;
    node["kind"] = "document";

    json includes = json::array();
    for (const auto* include : includes_of(document)) {
        includes.push_back(include->path);
    }
    node["includes"] = std::move(includes);

    json namespaces = json::object();
    for (const auto& header : document.headers) {
        if (const auto* ns = boost::get<Namespace>(&header)) {
            namespaces[ns->language] = ns->name.to_string();
        }
    }
    node["namespaces"] = std::move(namespaces);

    json definitions = json::array();
    for (const auto& definition : document.definitions) {
        definitions.push_back(definition_to_json(definition));
    }
    node["definitions"] = std::move(definitions);
    return node;
}

}  // namespace kestrel::idl::ast
