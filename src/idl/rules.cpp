#include "idl/config.hpp"
#include "idl/rules_definition.hpp"
#include "idl/error_handler.hpp"

#include <boost/spirit/home/x3.hpp>
#include <boost/spirit/home/x3/support/utility/annotate_on_success.hpp>

namespace kestrel::idl::parser::rule
{

#define DEFINE_ANNOTATED_RULE(rule_name) \
    struct rule_name##RuleClass : GenericParsingErrorHandler, x3::annotate_on_success {}

DEFINE_ANNOTATED_RULE(Document);
DEFINE_ANNOTATED_RULE(Include);
DEFINE_ANNOTATED_RULE(Namespace);
DEFINE_ANNOTATED_RULE(Typedef);
DEFINE_ANNOTATED_RULE(Constant);
DEFINE_ANNOTATED_RULE(Enum);
DEFINE_ANNOTATED_RULE(EnumValue);
DEFINE_ANNOTATED_RULE(StructLike);
DEFINE_ANNOTATED_RULE(Field);
DEFINE_ANNOTATED_RULE(Function);
DEFINE_ANNOTATED_RULE(Service);
DEFINE_ANNOTATED_RULE(UserType);
DEFINE_ANNOTATED_RULE(Annotation);

#undef DEFINE_ANNOTATED_RULE

BOOST_SPIRIT_INSTANTIATE(LineComment, iterator_type, context_type);
BOOST_SPIRIT_INSTANTIATE(BlockComment, iterator_type, context_type);
BOOST_SPIRIT_INSTANTIATE(Comment, iterator_type, context_type);
BOOST_SPIRIT_INSTANTIATE(Skipper, iterator_type, context_type);
BOOST_SPIRIT_INSTANTIATE(Skipper, iterator_type, boost::spirit::x3::unused_type);
BOOST_SPIRIT_INSTANTIATE(Identifier, iterator_type, context_type);
BOOST_SPIRIT_INSTANTIATE(Name, iterator_type, context_type);
BOOST_SPIRIT_INSTANTIATE(QualifiedIdentifier, iterator_type, context_type);
BOOST_SPIRIT_INSTANTIATE(StringLiteral, iterator_type, context_type);
BOOST_SPIRIT_INSTANTIATE(BooleanLiteral, iterator_type, context_type);
BOOST_SPIRIT_INSTANTIATE(IntegerLiteral, iterator_type, context_type);
BOOST_SPIRIT_INSTANTIATE(FloatLiteral, iterator_type, context_type);
BOOST_SPIRIT_INSTANTIATE(ConstantValue, iterator_type, context_type);
BOOST_SPIRIT_INSTANTIATE(BaseType, iterator_type, context_type);
BOOST_SPIRIT_INSTANTIATE(UserType, iterator_type, context_type);
BOOST_SPIRIT_INSTANTIATE(ListType, iterator_type, context_type);
BOOST_SPIRIT_INSTANTIATE(SetType, iterator_type, context_type);
BOOST_SPIRIT_INSTANTIATE(MapType, iterator_type, context_type);
BOOST_SPIRIT_INSTANTIATE(Type, iterator_type, context_type);
BOOST_SPIRIT_INSTANTIATE(AnnotationKey, iterator_type, context_type);
BOOST_SPIRIT_INSTANTIATE(Annotation, iterator_type, context_type);
BOOST_SPIRIT_INSTANTIATE(AnnotationList, iterator_type, context_type);
BOOST_SPIRIT_INSTANTIATE(Requiredness, iterator_type, context_type);
BOOST_SPIRIT_INSTANTIATE(Field, iterator_type, context_type);
BOOST_SPIRIT_INSTANTIATE(Typedef, iterator_type, context_type);
BOOST_SPIRIT_INSTANTIATE(Constant, iterator_type, context_type);
BOOST_SPIRIT_INSTANTIATE(EnumValue, iterator_type, context_type);
BOOST_SPIRIT_INSTANTIATE(Enum, iterator_type, context_type);
BOOST_SPIRIT_INSTANTIATE(StructKind, iterator_type, context_type);
BOOST_SPIRIT_INSTANTIATE(StructLike, iterator_type, context_type);
BOOST_SPIRIT_INSTANTIATE(ReturnType, iterator_type, context_type);
BOOST_SPIRIT_INSTANTIATE(Throws, iterator_type, context_type);
BOOST_SPIRIT_INSTANTIATE(Function, iterator_type, context_type);
BOOST_SPIRIT_INSTANTIATE(Service, iterator_type, context_type);
BOOST_SPIRIT_INSTANTIATE(Definition, iterator_type, context_type);
BOOST_SPIRIT_INSTANTIATE(Include, iterator_type, context_type);
BOOST_SPIRIT_INSTANTIATE(Namespace, iterator_type, context_type);
BOOST_SPIRIT_INSTANTIATE(Header, iterator_type, context_type);
BOOST_SPIRIT_INSTANTIATE(Document, iterator_type, context_type);

}  // namespace kestrel::idl::parser::rule
