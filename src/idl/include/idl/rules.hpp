#pragma once

#include "ast.hpp"

#include <boost/fusion/include/adapt_struct.hpp>
#include <boost/spirit/home/x3.hpp>
#include <boost/spirit/home/x3/support/ast/position_tagged.hpp>
#include <boost/spirit/home/x3/support/utility/annotate_on_success.hpp>
#include <boost/spirit/home/x3/support/utility/error_reporting.hpp>
#include <boost/spirit/home/x3/support/unused.hpp>

namespace kestrel::idl::parser
{

namespace x3 = boost::spirit::x3;

namespace rule
{

// comments and skipper
using LineComment = x3::rule<struct LineCommentRuleClass, std::string>;
using BlockComment = x3::rule<struct BlockCommentRuleClass, std::string>;
using Comment = x3::rule<struct CommentRuleClass, std::string>;
using Skipper = x3::rule<struct SkipperRuleClass, x3::unused_type const>;

// tokens
using Identifier = x3::rule<struct IdentifierRuleClass, std::string>;
using Name = x3::rule<struct NameRuleClass, std::string>;
using QualifiedIdentifier = x3::rule<struct QualifiedIdentifierRuleClass, ast::QualifiedIdentifier>;
using StringLiteral = x3::rule<struct StringLiteralRuleClass, std::string>;
using BooleanLiteral = x3::rule<struct BooleanLiteralRuleClass, bool>;
using IntegerLiteral = x3::rule<struct IntegerLiteralRuleClass, std::int64_t>;
using FloatLiteral = x3::rule<struct FloatLiteralRuleClass, double>;
using ConstantValue = x3::rule<struct ConstantValueRuleClass, ast::ConstantValue>;

// types
using Type = x3::rule<struct TypeRuleClass, ast::Type>;
using BaseType = x3::rule<struct BaseTypeRuleClass, ast::BaseType>;
using UserType = x3::rule<struct UserTypeRuleClass, ast::UserType>;
using ListType = x3::rule<struct ListTypeRuleClass, ast::ListType>;
using SetType = x3::rule<struct SetTypeRuleClass, ast::SetType>;
using MapType = x3::rule<struct MapTypeRuleClass, ast::MapType>;

// annotations
using AnnotationKey = x3::rule<struct AnnotationKeyRuleClass, std::string>;
using Annotation = x3::rule<struct AnnotationRuleClass, ast::Annotation>;
using AnnotationList = x3::rule<struct AnnotationListRuleClass, std::vector<ast::Annotation>>;

// fields
using Requiredness = x3::rule<struct RequirednessRuleClass, ast::Requiredness>;
using Field = x3::rule<struct FieldRuleClass, ast::Field>;

// definitions
using Typedef = x3::rule<struct TypedefRuleClass, ast::Typedef>;
using Constant = x3::rule<struct ConstantRuleClass, ast::Constant>;
using EnumValue = x3::rule<struct EnumValueRuleClass, ast::EnumValue>;
using Enum = x3::rule<struct EnumRuleClass, ast::Enum>;
using StructKind = x3::rule<struct StructKindRuleClass, ast::StructKind>;
using StructLike = x3::rule<struct StructLikeRuleClass, ast::StructLike>;
using ReturnType = x3::rule<struct ReturnTypeRuleClass, ast::ReturnType>;
using Throws = x3::rule<struct ThrowsRuleClass, std::vector<ast::Field>>;
using Function = x3::rule<struct FunctionRuleClass, ast::Function>;
using Service = x3::rule<struct ServiceRuleClass, ast::Service>;
using Definition = x3::rule<struct DefinitionRuleClass, ast::Definition>;

// headers / document
using Include = x3::rule<struct IncludeRuleClass, ast::Include>;
using Namespace = x3::rule<struct NamespaceRuleClass, ast::Namespace>;
using Header = x3::rule<struct HeaderRuleClass, ast::Header>;
using Document = x3::rule<struct DocumentRuleClass, ast::Document>;

// clang-format off

// grammar hookup
BOOST_SPIRIT_DECLARE(
    LineComment,
    BlockComment,
    Comment,
    Skipper,
    Identifier,
    Name,
    QualifiedIdentifier,
    StringLiteral,
    BooleanLiteral,
    IntegerLiteral,
    FloatLiteral,
    ConstantValue,
    BaseType,
    UserType,
    ListType,
    SetType,
    MapType,
    Type,
    AnnotationKey,
    Annotation,
    AnnotationList,
    Requiredness,
    Field,
    Typedef,
    Constant,
    EnumValue,
    Enum,
    StructKind,
    StructLike,
    ReturnType,
    Throws,
    Function,
    Service,
    Definition,
    Include,
    Namespace,
    Header,
    Document
)

// clang-format on
}  // namespace rule

rule::LineComment line_comment();
rule::BlockComment block_comment();
rule::Comment comment();
rule::Skipper skipper();
rule::Identifier identifier();
rule::Name name();
rule::QualifiedIdentifier qualified_identifier();
rule::StringLiteral string_literal();
rule::BooleanLiteral boolean_literal();
rule::IntegerLiteral integer_literal();
rule::FloatLiteral float_literal();
rule::ConstantValue const_value();
rule::BaseType base_type();
rule::UserType user_type();
rule::ListType list_type();
rule::SetType set_type();
rule::MapType map_type();
rule::Type type();
rule::Annotation annotation();
rule::AnnotationList annotation_list();
rule::Field field();
rule::Typedef typedef_decl();
rule::Constant const_decl();
rule::EnumValue enum_value();
rule::Enum enum_decl();
rule::StructLike struct_like();
rule::Function function();
rule::Service service();
rule::Definition definition();
rule::Include include();
rule::Namespace namespace_decl();
rule::Header header();
rule::Document document();

}  // namespace kestrel::idl::parser
