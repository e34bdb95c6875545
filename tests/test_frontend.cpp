#include <gtest/gtest.h>

#include "frontend/frontend.hpp"

#include <boost/variant/get.hpp>

#include <algorithm>
#include <filesystem>
#include <fstream>

class Frontend : public ::testing::Test
{
protected:
    std::filesystem::path temp_dir;

    void SetUp() override
    {
        temp_dir = std::filesystem::temp_directory_path() / "kestrel_frontend_tests";
        std::filesystem::create_directories(temp_dir);
    }

    void TearDown() override
    {
        std::error_code ec;
        std::filesystem::remove_all(temp_dir, ec);
    }

    std::filesystem::path WriteFile(const std::string& name, const std::string& content)
    {
        auto path = temp_dir / name;
        std::filesystem::create_directories(path.parent_path());
        std::ofstream f(path);
        f << content;
        return path;
    }

    std::string Normalized(const std::filesystem::path& path) const
    {
        return kestrel::frontend::detail::normalize_path(path);
    }
};

namespace
{

std::vector<std::string> names_of(const std::vector<const kestrel::frontend::SourceFile*>& files)
{
    std::vector<std::string> names;
    for (const auto* file : files) {
        names.push_back(file->reference_name());
    }
    return names;
}

}  // namespace

TEST_F(Frontend, ParseProgramSingleFile)
{
    auto idl = R"IDL(
        namespace go example.echo
        struct EchoRequest {
            1: string message
        }
        service Echo {
            EchoRequest echo(1: EchoRequest req)
        }
    )IDL";

    auto idl_path = WriteFile("echo.thrift", idl);

    auto result = kestrel::frontend::parse_program(idl_path.string());
    ASSERT_TRUE(result) << result.error();

    const auto& files = result->files;
    ASSERT_EQ(files.size(), 1);
    ASSERT_TRUE(files.contains(Normalized(idl_path)));
    ASSERT_EQ(result->roots.size(), 1);
    EXPECT_EQ(result->roots[0], Normalized(idl_path));

    const auto& file = files.at(Normalized(idl_path));
    EXPECT_EQ(file.reference_name(), "echo");
    EXPECT_EQ(file.content, idl);
    EXPECT_TRUE(file.position_cache.has_value());
    EXPECT_TRUE(file.includes.empty());

    const auto& definitions = file.document.definitions;
    ASSERT_EQ(definitions.size(), 2);
    const auto* record = boost::get<kestrel::idl::ast::StructLike>(&definitions.at(0));
    ASSERT_NE(record, nullptr);
    EXPECT_EQ(record->name, "EchoRequest");
    const auto* service = boost::get<kestrel::idl::ast::Service>(&definitions.at(1));
    ASSERT_NE(service, nullptr);
    EXPECT_EQ(service->functions.at(0).name, "echo");
}

TEST_F(Frontend, IncludesAreResolvedRelativeToIncludingFile)
{
    WriteFile("idl/base/base.thrift", "namespace go base\nstruct Base { 1: string LogID }\n");
    auto root = WriteFile("idl/api/echo.thrift",
                          "include \"../base/base.thrift\"\n"
                          "struct EchoRequest { 255: base.Base Base }\n");

    auto result = kestrel::frontend::parse_program(root.string());
    ASSERT_TRUE(result) << result.error();
    ASSERT_EQ(result->files.size(), 2);

    const auto* echo = result->find(Normalized(root));
    ASSERT_NE(echo, nullptr);
    ASSERT_EQ(echo->includes.size(), 1);
    EXPECT_EQ(echo->includes[0].alias, "base");
    EXPECT_EQ(echo->includes[0].path, Normalized(temp_dir / "idl/base/base.thrift"));

    const auto* include = echo->find_include("base");
    ASSERT_NE(include, nullptr);
    EXPECT_NE(result->find(include->path), nullptr);
    EXPECT_EQ(echo->find_include("other"), nullptr);
}

TEST_F(Frontend, DepthFirstVisitsSharedIncludeOnce)
{
    // a includes b and c, both of which include d
    WriteFile("d.thrift", "struct D { 1: i32 x }\n");
    WriteFile("b.thrift", "include \"d.thrift\"\nstruct B { 1: d.D d }\n");
    WriteFile("c.thrift", "include \"d.thrift\"\nstruct C { 1: d.D d }\n");
    auto root = WriteFile("a.thrift", "include \"b.thrift\"\ninclude \"c.thrift\"\nstruct A { 1: i32 x }\n");

    auto result = kestrel::frontend::parse_program(root.string());
    ASSERT_TRUE(result) << result.error();
    ASSERT_EQ(result->files.size(), 4);

    auto order = result->depth_first();
    EXPECT_EQ(names_of(order), (std::vector<std::string>{"a", "b", "d", "c"}));
}

TEST_F(Frontend, DepthFirstOverSeveralRoots)
{
    WriteFile("shared.thrift", "struct Shared { 1: i32 x }\n");
    auto first = WriteFile("first.thrift", "include \"shared.thrift\"\n");
    auto second = WriteFile("second.thrift", "include \"shared.thrift\"\n");

    auto result = kestrel::frontend::parse_program(std::vector<std::string>{first.string(), second.string()});
    ASSERT_TRUE(result) << result.error();
    ASSERT_EQ(result->roots.size(), 2);

    EXPECT_EQ(names_of(result->depth_first()), (std::vector<std::string>{"first", "shared", "second"}));
}

TEST_F(Frontend, IncludeCycleTerminates)
{
    WriteFile("ping.thrift", "include \"pong.thrift\"\n");
    auto root = WriteFile("pong.thrift", "include \"ping.thrift\"\n");

    auto result = kestrel::frontend::parse_program(root.string());
    ASSERT_TRUE(result) << result.error();
    EXPECT_EQ(result->files.size(), 2);
    EXPECT_EQ(names_of(result->depth_first()), (std::vector<std::string>{"pong", "ping"}));
}

TEST_F(Frontend, DuplicateRootIsVisitedOnce)
{
    auto root = WriteFile("only.thrift", "struct Only { 1: i32 x }\n");

    auto result = kestrel::frontend::parse_program(std::vector<std::string>{root.string(), root.string()});
    ASSERT_TRUE(result) << result.error();
    EXPECT_EQ(result->depth_first().size(), 1);
}

TEST_F(Frontend, AmbiguousIncludeAlias)
{
    WriteFile("one/base.thrift", "struct Base { 1: i32 x }\n");
    WriteFile("two/base.thrift", "struct Base { 1: i32 y }\n");
    auto root = WriteFile("root.thrift", "include \"one/base.thrift\"\ninclude \"two/base.thrift\"\n");

    auto result = kestrel::frontend::parse_program(root.string());
    ASSERT_FALSE(result);
    EXPECT_TRUE(result.error().starts_with("Ambiguous include 'base'")) << result.error();
}

TEST_F(Frontend, MissingInclude)
{
    auto root = WriteFile("root.thrift", "include \"missing.thrift\"\n");

    auto result = kestrel::frontend::parse_program(root.string());
    ASSERT_FALSE(result);
    EXPECT_TRUE(result.error().starts_with("Failed to open file: ")) << result.error();
    EXPECT_NE(result.error().find("missing.thrift"), std::string::npos);
}

TEST_F(Frontend, SyntaxErrorNamesFile)
{
    auto root = WriteFile("broken.thrift", "struct Broken { 1: i32 }\n");

    auto result = kestrel::frontend::parse_program(root.string());
    ASSERT_FALSE(result);
    EXPECT_TRUE(result.error().starts_with("Failed to parse " + Normalized(root))) << result.error();
}

TEST_F(Frontend, NoInputFiles)
{
    auto result = kestrel::frontend::parse_program(std::vector<std::string>{});
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error(), "No input files");
}
