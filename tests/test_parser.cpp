#include <gtest/gtest.h>
#include <boost/spirit/home/x3.hpp>
#include <boost/variant/get.hpp>

#include "idl/ast.hpp"
#include "idl/json_dump.hpp"
#include "idl/parser.hpp"

#include <nlohmann/json.hpp>

using namespace kestrel::idl;
using namespace kestrel::idl::parser;

TEST(Parser, ParseEmptyDocument) {
    const std::string input = "";
    auto result = parse_file(input);
    ASSERT_TRUE(result) << result.error();
    EXPECT_TRUE(result->document.headers.empty());
    EXPECT_TRUE(result->document.definitions.empty());
}

TEST(Parser, ParseIncludesAndNamespaces) {
    const std::string input =
        R"(include "base.thrift"
           include "shared/common.thrift"
           namespace go example.echo
           namespace * example.fallback)";

    auto result = parse_file(input);
    ASSERT_TRUE(result) << result.error();

    auto includes = ast::includes_of(result->document);
    ASSERT_EQ(includes.size(), 2);
    EXPECT_EQ(includes[0]->path, "base.thrift");
    EXPECT_EQ(includes[1]->path, "shared/common.thrift");

    EXPECT_EQ(ast::namespace_of(result->document, "go"), "example.echo");
    EXPECT_EQ(ast::namespace_of(result->document, "cpp"), "example.fallback");
}

TEST(Parser, NamespaceMissingForLanguage) {
    const std::string input = "namespace cpp example";
    auto result = parse_file(input);
    ASSERT_TRUE(result) << result.error();
    EXPECT_FALSE(ast::namespace_of(result->document, "go").has_value());
}

TEST(Parser, ParseStructsWithEnvelopeFields) {
    const std::string input =
        R"(include "base.thrift"
           struct EchoRequest {
             1: required string message,
             2: i64 seq = 0,
             255: optional base.Base Base,
           }
           struct EchoResponse {
             1: string message
             255: base.BaseResp BaseResp
           })";

    auto result = parse_file(input);
    ASSERT_TRUE(result) << result.error();

    auto records = ast::struct_likes_of(result->document);
    ASSERT_EQ(records.size(), 2);
    EXPECT_EQ(records[0]->name, "EchoRequest");
    ASSERT_EQ(records[0]->fields.size(), 3);
    EXPECT_EQ(records[0]->fields[2].id, 255);
    EXPECT_EQ(boost::get<ast::UserType>(records[0]->fields[2].type).name.to_string(), "base.Base");
    EXPECT_EQ(records[1]->fields[1].name, "BaseResp");
}

TEST(Parser, ParseServiceWithExceptions) {
    const std::string input =
        R"(exception EchoError { 1: i32 code; 2: string reason }
           service EchoService {
             string echo(1: string message) throws (1: EchoError err)
             oneway void notify(1: string message)
           })";

    auto result = parse_file(input);
    ASSERT_TRUE(result) << result.error();

    auto services = ast::services_of(result->document);
    ASSERT_EQ(services.size(), 1);
    ASSERT_EQ(services[0]->functions.size(), 2);
    EXPECT_EQ(services[0]->functions[0].throws.size(), 1);
    EXPECT_TRUE(services[0]->functions[1].oneway);

    auto records = ast::struct_likes_of(result->document);
    ASSERT_EQ(records.size(), 1);
    EXPECT_EQ(records[0]->kind, ast::StructKind::Exception);
}

TEST(Parser, PositionsAreRecorded) {
    const std::string input = "\nstruct Foo {\n  1: i32 x\n}\n";
    auto result = parse_file(input);
    ASSERT_TRUE(result) << result.error();

    auto records = ast::struct_likes_of(result->document);
    ASSERT_EQ(records.size(), 1);
    auto range = result->position_cache.position_of(*records[0]);
    EXPECT_EQ(std::string(range.begin(), range.end()).substr(0, 10), "struct Foo");
}

TEST(Parser, ErrorReportsDiagnostic) {
    const std::string input = "struct Foo { 1: i32 x ";
    auto result = parse_file(input, "broken.thrift");
    ASSERT_FALSE(result);
    EXPECT_NE(result.error().find("broken.thrift"), std::string::npos) << result.error();
}

TEST(Parser, ErrorReportsRemainingInput) {
    const std::string input = "struct Foo {} ???";
    auto result = parse_file(input);
    ASSERT_FALSE(result);
    EXPECT_TRUE(result.error().starts_with("Parse error near: ???")) << result.error();
}

TEST(Parser, JsonDump) {
    const std::string input =
        R"(namespace go example
           enum Color { RED = 1, GREEN }
           struct Point { 1: i64 x; 2: optional list<i32> tags (go.tag = "json:\"tags\"") }
           service Painter { void paint(1: Point at) })";

    auto result = parse_file(input);
    ASSERT_TRUE(result) << result.error();

    auto json = ast::to_json(result->document);
    EXPECT_EQ(json["kind"], "document");
    EXPECT_EQ(json["namespaces"]["go"], "example");
    ASSERT_EQ(json["definitions"].size(), 3);

    const auto& color = json["definitions"][0];
    EXPECT_EQ(color["kind"], "enum");
    EXPECT_EQ(color["values"].size(), 2);

    const auto& point = json["definitions"][1];
    EXPECT_EQ(point["kind"], "struct");
    EXPECT_EQ(point["fields"][0]["type"]["kind"], "base");
    EXPECT_EQ(point["fields"][0]["type"]["name"], "i64");
    EXPECT_EQ(point["fields"][1]["requiredness"], "optional");
    EXPECT_EQ(point["fields"][1]["type"]["kind"], "list");
    EXPECT_TRUE(point["fields"][1].contains("annotations"));

    const auto& painter = json["definitions"][2];
    EXPECT_EQ(painter["kind"], "service");
    EXPECT_EQ(painter["functions"][0]["result"], "void");
}
