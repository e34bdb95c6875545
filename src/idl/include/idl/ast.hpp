#pragma once

#include <boost/fusion/include/adapt_struct.hpp>
#include <boost/variant.hpp>
#include <boost/variant/recursive_wrapper.hpp>
#include <boost/spirit/home/x3/support/ast/position_tagged.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace kestrel::idl::ast
{

struct PositionTaggedNode : boost::spirit::x3::position_tagged {
};

// ---------- identifiers ----------

struct QualifiedIdentifier {
    std::vector<std::string> parts;  // e.g., {"base","BaseResp"}

    std::string to_string() const
    {
        std::string out;
        for (size_t i = 0; i < parts.size(); ++i) {
            if (i)
                out += '.';
            out += parts[i];
        }
        return out;
    }
};

// ---------- literals / constants ----------

// clang-format off
using ConstantValue = boost::variant<
    bool,
    std::int64_t,
    double,
    std::string,
    QualifiedIdentifier
>;
// clang-format on

// ---------- base & user types ----------

enum class BaseKind { Bool, Byte, I8, I16, I32, I64, Double, String, Binary };

struct BaseType {
    BaseKind kind{};
};

struct UserType : PositionTaggedNode {
    QualifiedIdentifier name;  // "Name" or "<include>.Name"
};

// Forward-declared recursive "Type"
struct ListType;
struct SetType;
struct MapType;

// clang-format off
using Type = boost::variant<
    BaseType,
    UserType,
    boost::recursive_wrapper<ListType>,
    boost::recursive_wrapper<SetType>,
    boost::recursive_wrapper<MapType>
>;
// clang-format on

struct ListType {
    Type element;
};

struct SetType {
    Type element;
};

struct MapType {
    Type key;
    Type value;
};

// ---------- annotations ----------

struct Annotation : PositionTaggedNode {
    std::string key;
    std::string value;  // (key = "value")
};

using AnnotationList = std::vector<Annotation>;

// ---------- fields ----------

enum class Requiredness { Default, Required, Optional };

struct Field : PositionTaggedNode {
    std::int64_t id = 0;
    Requiredness requiredness = Requiredness::Default;
    Type type;
    std::string name;
    std::optional<ConstantValue> default_value;
    AnnotationList annotations;
};

// ---------- declarations ----------

struct Typedef : PositionTaggedNode {
    Type type;
    std::string name;
};

struct Constant : PositionTaggedNode {
    Type type;
    std::string name;
    ConstantValue value;
};

struct EnumValue : PositionTaggedNode {
    std::string name;
    std::optional<std::int64_t> value;
};

struct Enum : PositionTaggedNode {
    std::string name;
    std::vector<EnumValue> values;
};

enum class StructKind { Struct, Union, Exception };

/**
 * @brief Record-like declaration: struct, union or exception.
 */
struct StructLike : PositionTaggedNode {
    StructKind kind = StructKind::Struct;
    std::string name;
    std::vector<Field> fields;
    AnnotationList annotations;
};

struct ReturnType {
    bool is_void = true;
    Type type;  // meaningful only if !is_void
};

struct Function : PositionTaggedNode {
    bool oneway = false;
    ReturnType result;
    std::string name;
    std::vector<Field> arguments;
    std::vector<Field> throws;
};

struct Service : PositionTaggedNode {
    std::string name;
    std::optional<QualifiedIdentifier> extends;
    std::vector<Function> functions;
};

// Any top-level definition
// clang-format off
using Definition = boost::variant<
    Typedef,
    Constant,
    Enum,
    StructLike,
    Service
>;
// clang-format on

// ---------- headers / document ----------

struct Include : PositionTaggedNode {
    std::string path;  // as in: include "base.thrift"
};

struct Namespace : PositionTaggedNode {
    std::string language;  // "go", "cpp" or "*"
    QualifiedIdentifier name;
};

using Header = boost::variant<Include, Namespace>;

/**
 * @brief Parse tree of one IDL file.
 */
struct Document : PositionTaggedNode {
    std::vector<Header> headers;
    std::vector<Definition> definitions;
};

// ---------- queries ----------

std::vector<const Include*> includes_of(const Document& document);

/**
 * @brief Namespace declared for @p language, falling back to the "*" namespace.
 */
std::optional<std::string> namespace_of(const Document& document, const std::string& language);

std::vector<const StructLike*> struct_likes_of(const Document& document);

std::vector<const Service*> services_of(const Document& document);

std::string to_string(BaseKind kind);
std::string to_string(StructKind kind);

}  // namespace kestrel::idl::ast

BOOST_FUSION_ADAPT_STRUCT(kestrel::idl::ast::QualifiedIdentifier, parts)
BOOST_FUSION_ADAPT_STRUCT(kestrel::idl::ast::BaseType, kind)
BOOST_FUSION_ADAPT_STRUCT(kestrel::idl::ast::UserType, name)
BOOST_FUSION_ADAPT_STRUCT(kestrel::idl::ast::ListType, element)
BOOST_FUSION_ADAPT_STRUCT(kestrel::idl::ast::SetType, element)
BOOST_FUSION_ADAPT_STRUCT(kestrel::idl::ast::MapType, key, value)
BOOST_FUSION_ADAPT_STRUCT(kestrel::idl::ast::Annotation, key, value)
BOOST_FUSION_ADAPT_STRUCT(kestrel::idl::ast::Field, id, requiredness, type, name, default_value, annotations)
BOOST_FUSION_ADAPT_STRUCT(kestrel::idl::ast::Typedef, type, name)
BOOST_FUSION_ADAPT_STRUCT(kestrel::idl::ast::Constant, type, name, value)
BOOST_FUSION_ADAPT_STRUCT(kestrel::idl::ast::EnumValue, name, value)
BOOST_FUSION_ADAPT_STRUCT(kestrel::idl::ast::Enum, name, values)
BOOST_FUSION_ADAPT_STRUCT(kestrel::idl::ast::StructLike, kind, name, fields, annotations)
BOOST_FUSION_ADAPT_STRUCT(kestrel::idl::ast::Function, oneway, result, name, arguments, throws)
BOOST_FUSION_ADAPT_STRUCT(kestrel::idl::ast::Service, name, extends, functions)
BOOST_FUSION_ADAPT_STRUCT(kestrel::idl::ast::Include, path)
BOOST_FUSION_ADAPT_STRUCT(kestrel::idl::ast::Namespace, language, name)
BOOST_FUSION_ADAPT_STRUCT(kestrel::idl::ast::Document, headers, definitions)
