#pragma once

#include "idl/ast.hpp"
#include "rules.hpp"

#include <optional>
#include <type_traits>

namespace boost::spirit::x3::traits
{

template <typename T>
struct is_substitute<std::optional<T>, boost::optional<T>> : std::true_type {
};

template <typename T>
struct is_substitute<boost::optional<T>, std::optional<T>> : std::true_type {
};

template <typename T>
struct is_optional<std::optional<T>> : mpl::true_ {
};

template <typename T>
struct optional_value<std::optional<T>> : mpl::identity<T> {
};

}  // namespace boost::spirit::x3::traits

/**
 * @file rules_definition.hpp
 * @brief Spirit rules definitions
 *
 * This file contains Spirit rules definitions for the Thrift IDL subset.
 *
 * @note This file is included in exactly one module, hence the NOLINT.
 *
 */
// NOLINTBEGIN(misc-definitions-in-headers)

namespace kestrel::idl::parser
{

namespace rule
{

namespace x3 = boost::spirit::x3;

// -------------- helpers --------------
inline auto make_kw(const char* s)
{
    return x3::lexeme[x3::lit(s) >> !(x3::alnum | x3::char_('_'))];
}

// clang-format off
// ... to make the rules more readable

const auto kw_include   = make_kw("include");
const auto kw_namespace = make_kw("namespace");
const auto kw_typedef   = make_kw("typedef");
const auto kw_const     = make_kw("const");
const auto kw_enum      = make_kw("enum");
const auto kw_struct    = make_kw("struct");
const auto kw_union     = make_kw("union");
const auto kw_exception = make_kw("exception");
const auto kw_service   = make_kw("service");
const auto kw_extends   = make_kw("extends");
const auto kw_oneway    = make_kw("oneway");
const auto kw_void      = make_kw("void");
const auto kw_throws    = make_kw("throws");
const auto kw_required  = make_kw("required");
const auto kw_optional  = make_kw("optional");
const auto kw_list      = make_kw("list");
const auto kw_set       = make_kw("set");
const auto kw_map       = make_kw("map");

// base types
const auto kw_bool   = make_kw("bool");
const auto kw_byte   = make_kw("byte");
const auto kw_i8     = make_kw("i8");
const auto kw_i16    = make_kw("i16");
const auto kw_i32    = make_kw("i32");
const auto kw_i64    = make_kw("i64");
const auto kw_double = make_kw("double");
const auto kw_string = make_kw("string");
const auto kw_binary = make_kw("binary");

// boolean constants
const auto kw_true   = make_kw("true");
const auto kw_false  = make_kw("false");

x3::symbols<> reserved_identifiers;
struct reserved_init {
  reserved_init() {
    reserved_identifiers.add
      ("include")
      ("namespace")
      ("typedef")
      ("const")
      ("enum")
      ("struct")
      ("union")
      ("exception")
      ("service")
      ("extends")
      ("oneway")
      ("void")
      ("throws")
      ("required")
      ("optional")
      ("list")
      ("set")
      ("map")
      // base types
      ("bool")
      ("byte")
      ("i8")
      ("i16")
      ("i32")
      ("i64")
      ("double")
      ("string")
      ("binary")
      ("true")
      ("false");
  }
} reserved_init_instance;

const auto list_separator = x3::lit(',') | x3::lit(';');

// skipper
LineComment line_comment = "line_comment";
BlockComment block_comment = "block_comment";
Comment comment = "comment";
Skipper skipper = "skipper";

const auto line_comment_def = x3::lexeme[(x3::lit("//") | x3::lit('#')) >> *(x3::char_ - x3::eol) >> (x3::eol | x3::eoi)];
const auto block_comment_def = x3::lexeme["/*" >> *(x3::char_ - "*/") >> "*/"];
const auto comment_def = line_comment | block_comment;
const auto skipper_def = comment | x3::space;

// tokens
Identifier identifier = "ident";
Name name = "name";
QualifiedIdentifier qualified_identifier = "qident";
StringLiteral string_lit = "string_lit";
BooleanLiteral bool_lit = "bool_lit";
IntegerLiteral int_lit = "int_lit";
FloatLiteral float_lit = "float_lit";
ConstantValue const_value = "const_value";

// identifiers
const auto identifier_def =
    x3::lexeme[
        (x3::alpha | x3::char_('_'))
        >> *(x3::alnum | x3::char_('_'))
    ];

// a keyword is only rejected as a whole word, so "structure" is still a name
const auto name_def =
    x3::lexeme[ !(reserved_identifiers >> !(x3::alnum | x3::char_('_')))
        >> (x3::alpha | x3::char_('_'))
        >> *(x3::alnum | x3::char_('_'))
    ];

const auto qualified_identifier_def =
    (identifier % '.')
    [([](auto& ctx){
        _val(ctx) = ast::QualifiedIdentifier{
            .parts = std::move(_attr(ctx))
        };
    })];

// strings: both quote styles, simple escapes are reduced to the escaped character
const auto string_lit_def =
    x3::lexeme['"' >> *(('\\' >> x3::char_) | ~x3::char_('"')) >> '"']
    | x3::lexeme['\'' >> *(('\\' >> x3::char_) | ~x3::char_('\'')) >> '\''];

const auto bool_lit_def  = (kw_true  >> x3::attr(true))
                         | (kw_false >> x3::attr(false));

// integers: hex 0x... or decimal (int64); a trailing '.' or exponent belongs to a float
const auto int_lit_def =
    x3::lexeme[x3::lit("0x") >> x3::uint_parser<std::uint64_t, 16>{}]
        [([](auto& ctx){
            _val(ctx) = static_cast<std::int64_t>(_attr(ctx));
        })]
  | x3::lexeme[x3::int64 >> !(x3::char_('.') | x3::char_('e') | x3::char_('E') | x3::char_('x'))]
        [([](auto& ctx){
            _val(ctx) = _attr(ctx);      // explicit assignment is a must here
        })];

// floats: a '.' or an exponent is mandatory, plain integers go to int_lit
const auto float_lit_def = x3::real_parser<double, x3::strict_real_policies<double>>{};

// const value: bool | float | int | string | qident
const auto const_value_def =
    bool_lit
    | float_lit    // strict, must be before int_lit
    | int_lit
    | string_lit
    | qualified_identifier;

// -------------- type rules --------------
Type type = "type";
BaseType base_type = "base_type";
UserType user_type = "user_type";
ListType list_type = "list_type";
SetType set_type = "set_type";
MapType map_type = "map_type";

const auto base_type_def =
    (kw_bool     >> x3::attr(ast::BaseType{ast::BaseKind::Bool}))
    | (kw_byte   >> x3::attr(ast::BaseType{ast::BaseKind::Byte}))
    | (kw_i8     >> x3::attr(ast::BaseType{ast::BaseKind::I8}))
    | (kw_i16    >> x3::attr(ast::BaseType{ast::BaseKind::I16}))
    | (kw_i32    >> x3::attr(ast::BaseType{ast::BaseKind::I32}))
    | (kw_i64    >> x3::attr(ast::BaseType{ast::BaseKind::I64}))
    | (kw_double >> x3::attr(ast::BaseType{ast::BaseKind::Double}))
    | (kw_string >> x3::attr(ast::BaseType{ast::BaseKind::String}))
    | (kw_binary >> x3::attr(ast::BaseType{ast::BaseKind::Binary}));

const auto user_type_def = qualified_identifier;

// list_type / set_type: attribute of the sequence is just the inner `Type`
// because tokens/keywords contribute no attributes.
const auto list_type_def = kw_list >> '<' >> type >> '>';
const auto set_type_def = kw_set >> '<' >> type >> '>';

// map_type: attribute of the sequence is a Fusion sequence (Type, Type)
const auto map_type_def = kw_map >> '<' >> type >> ',' >> type >> '>';

const auto type_def =
    base_type
    | list_type
    | set_type
    | map_type
    | user_type;

// -------------- annotations --------------
AnnotationKey annotation_key = "annotation_key";
Annotation annotation = "annotation";
AnnotationList annotation_list = "annotation_list";

const auto annotation_key_def =
    x3::lexeme[
        (x3::alpha | x3::char_('_'))
        >> *(x3::alnum | x3::char_('_') | x3::char_('.'))
    ];

const auto annotation_def = annotation_key >> '=' >> string_lit;

const auto annotation_list_def = '(' >> *(annotation >> -list_separator) >> ')';

const auto annotation_list_or_empty =
    annotation_list | x3::attr(ast::AnnotationList{});

// -------------- fields --------------
Requiredness requiredness = "requiredness";
Field field = "field";

const auto requiredness_def =
    (kw_required   >> x3::attr(ast::Requiredness::Required))
    | (kw_optional >> x3::attr(ast::Requiredness::Optional))
    | x3::attr(ast::Requiredness::Default);

const auto field_def =
    int_lit >> ':' >> requiredness >> type >> name >> -('=' >> const_value) >> annotation_list_or_empty
    >> -list_separator;

// -------------- definitions --------------
Typedef typedef_decl = "typedef_decl";
Constant const_decl = "const_decl";
EnumValue enum_value = "enum_value";
Enum enum_decl = "enum_decl";
StructKind struct_kind = "struct_kind";
StructLike struct_like = "struct_like";
ReturnType return_type = "return_type";
Throws throws = "throws";
Function function = "function";
Service service = "service";
Definition definition = "definition";

const auto typedef_decl_def =
    kw_typedef > type > name > x3::omit[-annotation_list] > -list_separator;

const auto const_decl_def =
    kw_const > type > name > '=' > const_value > -list_separator;

const auto enum_value_def =
    identifier >> -('=' >> int_lit) >> x3::omit[-annotation_list] >> -list_separator;

const auto enum_decl_def =
    kw_enum > name > '{' > *enum_value > '}' > x3::omit[-annotation_list];

const auto struct_kind_def =
    (kw_struct      >> x3::attr(ast::StructKind::Struct))
    | (kw_union     >> x3::attr(ast::StructKind::Union))
    | (kw_exception >> x3::attr(ast::StructKind::Exception));

const auto struct_like_def =
    struct_kind > name > '{' > *field > '}' > annotation_list_or_empty;

const auto return_type_def =
    kw_void[([](auto& ctx){ _val(ctx) = ast::ReturnType{}; })]
    | type[([](auto& ctx){ _val(ctx) = ast::ReturnType{.is_void = false, .type = std::move(_attr(ctx))}; })];

const auto throws_def =
    (kw_throws >> '(' >> *field >> ')')
    | x3::attr(std::vector<ast::Field>{});

const auto function_def =
    x3::matches[kw_oneway] >> return_type >> name >> '(' >> *field >> ')' >> throws
    >> x3::omit[-annotation_list] >> -list_separator;

const auto service_def =
    kw_service > name > -(kw_extends > qualified_identifier) > '{' > *function > '}'
    > x3::omit[-annotation_list];

const auto definition_def =
    typedef_decl
    | const_decl
    | enum_decl
    | struct_like
    | service;

// -------------- headers / document --------------
Include include = "include";
Namespace namespace_decl = "namespace_decl";
Header header = "header";
Document document = "document";

const auto include_def = kw_include > string_lit > -list_separator;

const auto namespace_decl_def =
    kw_namespace > (x3::string("*") | identifier) > qualified_identifier > -list_separator;

const auto header_def = include | namespace_decl;

const auto document_def = *header >> *definition;

// clang-format on

// clang-format off
BOOST_SPIRIT_DEFINE(
    line_comment,
    block_comment,
    comment,
    skipper,
    identifier,
    name,
    qualified_identifier,
    string_lit,
    bool_lit,
    int_lit,
    float_lit,
    const_value,
    base_type,
    user_type,
    list_type,
    set_type,
    map_type,
    type,
    annotation_key,
    annotation,
    annotation_list,
    requiredness,
    field,
    typedef_decl,
    const_decl,
    enum_value,
    enum_decl,
    struct_kind,
    struct_like,
    return_type,
    throws,
    function,
    service,
    definition,
    include,
    namespace_decl,
    header,
    document
);
// clang-format on

}  // namespace rule

rule::LineComment line_comment()
{
    return rule::line_comment;
}

rule::BlockComment block_comment()
{
    return rule::block_comment;
}

rule::Comment comment()
{
    return rule::comment;
}

rule::Skipper skipper()
{
    return rule::skipper;
}

rule::Identifier identifier()
{
    return rule::identifier;
}

rule::Name name()
{
    return rule::name;
}

rule::QualifiedIdentifier qualified_identifier()
{
    return rule::qualified_identifier;
}

rule::StringLiteral string_literal()
{
    return rule::string_lit;
}

rule::BooleanLiteral boolean_literal()
{
    return rule::bool_lit;
}

rule::IntegerLiteral integer_literal()
{
    return rule::int_lit;
}

rule::FloatLiteral float_literal()
{
    return rule::float_lit;
}

rule::ConstantValue const_value()
{
    return rule::const_value;
}

rule::BaseType base_type()
{
    return rule::base_type;
}

rule::UserType user_type()
{
    return rule::user_type;
}

rule::ListType list_type()
{
    return rule::list_type;
}

rule::SetType set_type()
{
    return rule::set_type;
}

rule::MapType map_type()
{
    return rule::map_type;
}

rule::Type type()
{
    return rule::type;
}

rule::Annotation annotation()
{
    return rule::annotation;
}

rule::AnnotationList annotation_list()
{
    return rule::annotation_list;
}

rule::Field field()
{
    return rule::field;
}

rule::Typedef typedef_decl()
{
    return rule::typedef_decl;
}

rule::Constant const_decl()
{
    return rule::const_decl;
}

rule::EnumValue enum_value()
{
    return rule::enum_value;
}

rule::Enum enum_decl()
{
    return rule::enum_decl;
}

rule::StructLike struct_like()
{
    return rule::struct_like;
}

rule::Function function()
{
    return rule::function;
}

rule::Service service()
{
    return rule::service;
}

rule::Definition definition()
{
    return rule::definition;
}

rule::Include include()
{
    return rule::include;
}

rule::Namespace namespace_decl()
{
    return rule::namespace_decl;
}

rule::Header header()
{
    return rule::header;
}

rule::Document document()
{
    return rule::document;
}

}  // namespace kestrel::idl::parser

// NOLINTEND(misc-definitions-in-headers)
