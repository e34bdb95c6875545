#include <gtest/gtest.h>
#include <string>
#include <boost/spirit/home/x3.hpp>
#include <boost/variant/get.hpp>
#include <vector>

#include "idl/ast.hpp"
#include "idl/config.hpp"
#include "idl/rules.hpp"

using namespace kestrel::idl;
using namespace kestrel::idl::parser;

template <typename Rule, typename Attr>
testing::AssertionResult parse_rule(const std::string& input,
                                       Rule const& rule,
                                       Attr& out)
{
    auto first = input.begin();
    auto last = input.end();

    // error handling
    error_context_type err_handler(first, last, std::cerr);
    auto const with_err = x3::with<x3::error_handler_tag>(std::ref(err_handler))[ rule ];

    bool ok = phrase_parse(first, last, with_err, skipper(), out);

    if (!ok) {
        return testing::AssertionFailure()
            << "parse failed for input: `" << input << "`";
    }
    if (first != last) {
        return testing::AssertionFailure()
            << "parse did not consume full input. Remaining: `"
            << std::string(first, last) << "`";
    }
    return testing::AssertionSuccess();
}

TEST(IdlRule, ParseBoolLiteral) {
    {
        bool b = false;
        ASSERT_TRUE(parse_rule("true", boolean_literal(), b));
        EXPECT_TRUE(b);
    }
    {
        bool b = true;
        ASSERT_TRUE(parse_rule("false", boolean_literal(), b));
        EXPECT_FALSE(b);
    }
}

TEST(IdlRule, ParseIntLiteral) {
    int64_t i{};
    ASSERT_TRUE(parse_rule("123", integer_literal(), i));
    EXPECT_EQ(i, 123);
    ASSERT_TRUE(parse_rule("-321", integer_literal(), i));
    EXPECT_EQ(i, -321);
    ASSERT_TRUE(parse_rule("0xFF", integer_literal(), i));
    EXPECT_EQ(i, 255);
    ASSERT_TRUE(parse_rule("0xab", integer_literal(), i));
    EXPECT_EQ(i, 171);

    // a float is not an integer
    EXPECT_FALSE(parse_rule("1.5", integer_literal(), i));
    EXPECT_FALSE(parse_rule("1e3", integer_literal(), i));
}

TEST(IdlRule, ParseFloatLiteral) {
    double d{};
    ASSERT_TRUE(parse_rule("1.5", float_literal(), d));
    EXPECT_DOUBLE_EQ(d, 1.5);
    ASSERT_TRUE(parse_rule("-2e3", float_literal(), d));
    EXPECT_DOUBLE_EQ(d, -2000.0);

    // strict: plain integers are rejected
    EXPECT_FALSE(parse_rule("42", float_literal(), d));
}

TEST(IdlRule, ParseStringLiteral) {
    std::string s;
    ASSERT_TRUE(parse_rule(R"("hello world")", string_literal(), s));
    EXPECT_EQ(s, "hello world");

    s.clear();
    ASSERT_TRUE(parse_rule(R"('single')", string_literal(), s));
    EXPECT_EQ(s, "single");

    s.clear();
    ASSERT_TRUE(parse_rule(R"("json:\"id\"")", string_literal(), s));
    EXPECT_EQ(s, R"(json:"id")");
}

TEST(IdlRule, ParseConstantValue) {
    {
        ast::ConstantValue v;
        ASSERT_TRUE(parse_rule("true", const_value(), v));
        EXPECT_EQ(boost::get<bool>(v), true);
    }
    {
        ast::ConstantValue v;
        ASSERT_TRUE(parse_rule("7", const_value(), v));
        EXPECT_EQ(boost::get<std::int64_t>(v), 7);
    }
    {
        ast::ConstantValue v;
        ASSERT_TRUE(parse_rule("0.25", const_value(), v));
        EXPECT_DOUBLE_EQ(boost::get<double>(v), 0.25);
    }
    {
        ast::ConstantValue v;
        ASSERT_TRUE(parse_rule("\"x\"", const_value(), v));
        EXPECT_EQ(boost::get<std::string>(v), "x");
    }
    {
        ast::ConstantValue v;
        ASSERT_TRUE(parse_rule("Status.OK", const_value(), v));
        EXPECT_EQ(boost::get<ast::QualifiedIdentifier>(v).to_string(), "Status.OK");
    }
}

TEST(IdlRule, ParseNameRejectsKeywordsOnlyAsWholeWords) {
    std::string n;
    EXPECT_FALSE(parse_rule("struct", name(), n));

    n.clear();
    ASSERT_TRUE(parse_rule("structure", name(), n));
    EXPECT_EQ(n, "structure");

    n.clear();
    ASSERT_TRUE(parse_rule("_i32", name(), n));
    EXPECT_EQ(n, "_i32");
}

TEST(IdlRule, ParseBaseTypes) {
    const std::vector<std::pair<std::string, ast::BaseKind>> cases{
        {"bool", ast::BaseKind::Bool},     {"byte", ast::BaseKind::Byte},     {"i8", ast::BaseKind::I8},
        {"i16", ast::BaseKind::I16},       {"i32", ast::BaseKind::I32},       {"i64", ast::BaseKind::I64},
        {"double", ast::BaseKind::Double}, {"string", ast::BaseKind::String}, {"binary", ast::BaseKind::Binary},
    };
    for (const auto& [text, kind] : cases) {
        ast::Type t;
        ASSERT_TRUE(parse_rule(text, type(), t)) << text;
        const auto* base = boost::get<ast::BaseType>(&t);
        ASSERT_NE(base, nullptr) << text;
        EXPECT_EQ(base->kind, kind) << text;
    }
}

TEST(IdlRule, ParseContainerTypes) {
    ast::Type t;
    ASSERT_TRUE(parse_rule("map<string, list<base.Base>>", type(), t));
    const auto* map = boost::get<ast::MapType>(&t);
    ASSERT_NE(map, nullptr);
    EXPECT_EQ(boost::get<ast::BaseType>(map->key).kind, ast::BaseKind::String);
    const auto& list = boost::get<ast::ListType>(map->value);
    EXPECT_EQ(boost::get<ast::UserType>(list.element).name.to_string(), "base.Base");

    ast::Type s;
    ASSERT_TRUE(parse_rule("set<i64>", type(), s));
    EXPECT_NE(boost::get<ast::SetType>(&s), nullptr);
}

TEST(IdlRule, ParseUserTypeStartingWithKeyword) {
    ast::Type t;
    ASSERT_TRUE(parse_rule("listing", type(), t));
    const auto* user = boost::get<ast::UserType>(&t);
    ASSERT_NE(user, nullptr);
    EXPECT_EQ(user->name.to_string(), "listing");
}

TEST(IdlRule, ParseField) {
    ast::Field f;
    ASSERT_TRUE(parse_rule(R"(1: required i64 id = 10 (go.tag = "json:\"id\"");)", field(), f));
    EXPECT_EQ(f.id, 1);
    EXPECT_EQ(f.requiredness, ast::Requiredness::Required);
    EXPECT_EQ(boost::get<ast::BaseType>(f.type).kind, ast::BaseKind::I64);
    EXPECT_EQ(f.name, "id");
    ASSERT_TRUE(f.default_value.has_value());
    EXPECT_EQ(boost::get<std::int64_t>(*f.default_value), 10);
    ASSERT_EQ(f.annotations.size(), 1);
    EXPECT_EQ(f.annotations[0].key, "go.tag");
    EXPECT_EQ(f.annotations[0].value, R"(json:"id")");
}

TEST(IdlRule, ParseFieldDefaults) {
    ast::Field f;
    ASSERT_TRUE(parse_rule("255: base.Base Base", field(), f));
    EXPECT_EQ(f.id, 255);
    EXPECT_EQ(f.requiredness, ast::Requiredness::Default);
    EXPECT_EQ(boost::get<ast::UserType>(f.type).name.to_string(), "base.Base");
    EXPECT_EQ(f.name, "Base");
    EXPECT_FALSE(f.default_value.has_value());
    EXPECT_TRUE(f.annotations.empty());
}

TEST(IdlRule, ParseStructLike) {
    {
        ast::StructLike s;
        ASSERT_TRUE(parse_rule(R"(
            struct Request {
                1: i64 id,
                2: optional string name;
                3: bool active
            } (go.type = "x")
        )", struct_like(), s));
        EXPECT_EQ(s.kind, ast::StructKind::Struct);
        EXPECT_EQ(s.name, "Request");
        ASSERT_EQ(s.fields.size(), 3);
        EXPECT_EQ(s.fields[1].requiredness, ast::Requiredness::Optional);
        ASSERT_EQ(s.annotations.size(), 1);
    }
    {
        ast::StructLike s;
        ASSERT_TRUE(parse_rule("union Value { 1: i32 i; 2: string s }", struct_like(), s));
        EXPECT_EQ(s.kind, ast::StructKind::Union);
    }
    {
        ast::StructLike s;
        ASSERT_TRUE(parse_rule("exception Oops { 1: string message }", struct_like(), s));
        EXPECT_EQ(s.kind, ast::StructKind::Exception);
    }
}

TEST(IdlRule, ParseEnum) {
    ast::Enum e;
    ASSERT_TRUE(parse_rule("enum Status { OK = 0, FAILED = 0x10, UNKNOWN }", enum_decl(), e));
    EXPECT_EQ(e.name, "Status");
    ASSERT_EQ(e.values.size(), 3);
    EXPECT_EQ(e.values[0].value, 0);
    EXPECT_EQ(e.values[1].value, 16);
    EXPECT_FALSE(e.values[2].value.has_value());
}

TEST(IdlRule, ParseTypedefAndConst) {
    {
        ast::Typedef t;
        ASSERT_TRUE(parse_rule("typedef i64 UserId", typedef_decl(), t));
        EXPECT_EQ(t.name, "UserId");
        EXPECT_EQ(boost::get<ast::BaseType>(t.type).kind, ast::BaseKind::I64);
    }
    {
        ast::Constant c;
        ASSERT_TRUE(parse_rule("const string Greeting = \"hi\";", const_decl(), c));
        EXPECT_EQ(c.name, "Greeting");
        EXPECT_EQ(boost::get<std::string>(c.value), "hi");
    }
}

TEST(IdlRule, ParseService) {
    ast::Service s;
    ASSERT_TRUE(parse_rule(R"(
        service Echo extends base.BaseService {
            EchoResponse echo(1: EchoRequest req) throws (1: Oops oops),
            oneway void ping(),
            void reset();
        }
    )", service(), s));
    EXPECT_EQ(s.name, "Echo");
    ASSERT_TRUE(s.extends.has_value());
    EXPECT_EQ(s.extends->to_string(), "base.BaseService");
    ASSERT_EQ(s.functions.size(), 3);

    const auto& echo = s.functions[0];
    EXPECT_FALSE(echo.oneway);
    EXPECT_FALSE(echo.result.is_void);
    EXPECT_EQ(boost::get<ast::UserType>(echo.result.type).name.to_string(), "EchoResponse");
    ASSERT_EQ(echo.arguments.size(), 1);
    ASSERT_EQ(echo.throws.size(), 1);
    EXPECT_EQ(echo.throws[0].name, "oops");

    EXPECT_TRUE(s.functions[1].oneway);
    EXPECT_TRUE(s.functions[1].result.is_void);
    EXPECT_TRUE(s.functions[2].arguments.empty());
}

TEST(IdlRule, ParseHeaders) {
    {
        ast::Include inc;
        ASSERT_TRUE(parse_rule("include \"base.thrift\"", include(), inc));
        EXPECT_EQ(inc.path, "base.thrift");
    }
    {
        ast::Namespace ns;
        ASSERT_TRUE(parse_rule("namespace go example.echo", namespace_decl(), ns));
        EXPECT_EQ(ns.language, "go");
        EXPECT_EQ(ns.name.to_string(), "example.echo");
    }
    {
        ast::Namespace ns;
        ASSERT_TRUE(parse_rule("namespace * shared", namespace_decl(), ns));
        EXPECT_EQ(ns.language, "*");
    }
}

TEST(IdlRule, ParseDocumentWithComments) {
    ast::Document doc;
    ASSERT_TRUE(parse_rule(R"(
        # shell style comment
        include "base.thrift"
        namespace go example.echo // trailing comment

        /* block
           comment */
        struct Request {
            1: i64 id
        }
    )", document(), doc));
    EXPECT_EQ(doc.headers.size(), 2);
    EXPECT_EQ(doc.definitions.size(), 1);
}
