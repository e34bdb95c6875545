#include <gtest/gtest.h>

#include "codegen/field_classifier.hpp"
#include "codegen/field_reorderer.hpp"
#include "codegen/golang/code_utils.hpp"
#include "frontend/frontend.hpp"

#include <boost/variant/get.hpp>

#include <filesystem>
#include <fstream>

using namespace kestrel;
using namespace kestrel::codegen;

namespace ast = kestrel::idl::ast;

namespace
{

ast::Field make_field(std::int64_t id, const std::string& name, ast::Type type)
{
    ast::Field field;
    field.id = id;
    field.name = name;
    field.type = std::move(type);
    return field;
}

ast::Type base(ast::BaseKind kind)
{
    return ast::BaseType{kind};
}

ast::Type user(const std::string& name)
{
    ast::UserType type;
    type.name.parts = {name};
    return type;
}

// base types only: everything but string and binary is fixed
Result<bool> base_types_only(const ast::Type& type)
{
    const auto* b = boost::get<ast::BaseType>(&type);
    if (b == nullptr) {
        return unexpected_result<bool>(ErrorKind::TypeClassification, "not a base type");
    }
    return b->kind != ast::BaseKind::String && b->kind != ast::BaseKind::Binary;
}

std::vector<std::string> names_of(const std::vector<const ast::Field*>& fields)
{
    std::vector<std::string> names;
    for (const auto* field : fields) {
        names.push_back(field->name);
    }
    return names;
}

}  // namespace

TEST(FieldClassifier, ClassifiesByPredicate)
{
    auto id = make_field(1, "id", base(ast::BaseKind::I64));
    auto name = make_field(2, "name", base(ast::BaseKind::String));

    auto fixed = classify_field(id, base_types_only);
    ASSERT_TRUE(fixed) << fixed.error().to_string();
    EXPECT_EQ(*fixed, EncodingClass::FixedWidth);

    auto variable = classify_field(name, base_types_only);
    ASSERT_TRUE(variable) << variable.error().to_string();
    EXPECT_EQ(*variable, EncodingClass::VariableWidth);

    EXPECT_EQ(to_string(EncodingClass::FixedWidth), "fixed-width");
    EXPECT_EQ(to_string(EncodingClass::VariableWidth), "variable-width");
}

TEST(FieldClassifier, PropagatesPredicateError)
{
    auto field = make_field(1, "other", user("Other"));

    auto result = classify_field(field, base_types_only);
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().kind(), ErrorKind::TypeClassification);
    EXPECT_EQ(result.error().message, "not a base type");
}

TEST(FieldReorderer, FixedWidthFieldsComeFirst)
{
    std::vector<ast::Field> fields{
        make_field(1, "id", base(ast::BaseKind::I64)),
        make_field(2, "name", base(ast::BaseKind::String)),
        make_field(3, "active", base(ast::BaseKind::Bool)),
    };

    auto ordered = reorder_fields(fields, base_types_only);
    ASSERT_TRUE(ordered) << ordered.error().to_string();
    EXPECT_EQ(names_of(*ordered), (std::vector<std::string>{"id", "active", "name"}));
}

TEST(FieldReorderer, PartitionIsStable)
{
    std::vector<ast::Field> fields{
        make_field(1, "s1", base(ast::BaseKind::String)),
        make_field(2, "f1", base(ast::BaseKind::I32)),
        make_field(3, "s2", base(ast::BaseKind::Binary)),
        make_field(4, "f2", base(ast::BaseKind::Double)),
        make_field(5, "s3", base(ast::BaseKind::String)),
        make_field(6, "f3", base(ast::BaseKind::Byte)),
    };

    auto ordered = reorder_fields(fields, base_types_only);
    ASSERT_TRUE(ordered) << ordered.error().to_string();
    EXPECT_EQ(names_of(*ordered), (std::vector<std::string>{"f1", "f2", "f3", "s1", "s2", "s3"}));

    // the result points into the input
    EXPECT_EQ(ordered->front(), &fields[1]);
}

TEST(FieldReorderer, ReorderingIsIdempotent)
{
    std::vector<ast::Field> fields{
        make_field(1, "name", base(ast::BaseKind::String)),
        make_field(2, "id", base(ast::BaseKind::I64)),
        make_field(3, "tag", base(ast::BaseKind::Binary)),
        make_field(4, "flag", base(ast::BaseKind::Bool)),
    };

    auto once = reorder_fields(fields, base_types_only);
    ASSERT_TRUE(once);

    std::vector<ast::Field> reordered;
    for (const auto* field : *once) {
        reordered.push_back(*field);
    }
    auto twice = reorder_fields(reordered, base_types_only);
    ASSERT_TRUE(twice);
    EXPECT_EQ(names_of(*once), names_of(*twice));
}

TEST(FieldReorderer, EmptyAndUniformRecords)
{
    std::vector<ast::Field> none;
    auto empty = reorder_fields(none, base_types_only);
    ASSERT_TRUE(empty);
    EXPECT_TRUE(empty->empty());

    std::vector<ast::Field> all_variable{
        make_field(1, "a", base(ast::BaseKind::String)),
        make_field(2, "b", base(ast::BaseKind::Binary)),
    };
    auto unchanged = reorder_fields(all_variable, base_types_only);
    ASSERT_TRUE(unchanged);
    EXPECT_EQ(names_of(*unchanged), (std::vector<std::string>{"a", "b"}));
}

TEST(FieldReorderer, FailsWithoutPartialResult)
{
    std::vector<ast::Field> fields{
        make_field(1, "id", base(ast::BaseKind::I64)),
        make_field(2, "other", user("Other")),
        make_field(3, "name", base(ast::BaseKind::String)),
    };

    int calls = 0;
    FixedWidthPredicate counting = [&calls](const ast::Type& type) {
        ++calls;
        return base_types_only(type);
    };

    auto ordered = reorder_fields(fields, counting);
    ASSERT_FALSE(ordered);
    EXPECT_EQ(ordered.error().kind(), ErrorKind::TypeClassification);
    EXPECT_EQ(calls, 2);
}

class FieldLayoutWithTypes : public ::testing::Test
{
protected:
    std::filesystem::path temp_dir;
    frontend::Program program;

    void SetUp() override
    {
        temp_dir = std::filesystem::temp_directory_path() / "kestrel_layout_tests";
        std::filesystem::create_directories(temp_dir);

        WriteFile("base.thrift", R"IDL(
            namespace go base
            struct Base { 1: string LogID }
            struct Point { 1: double x; 2: double y }
        )IDL");
        auto root = WriteFile("layout.thrift", R"IDL(
            include "base.thrift"
            typedef i64 UserId
            typedef string Label
            enum Status { OK, FAILED }
            union Choice { 1: i32 a; 2: i64 b }
            struct Pair { 1: i32 a; 2: Status s }
            struct Node { 1: i64 value; 2: Node next }
            struct LabelFirst { 1: string label; 2: optional LabelFirst next }
            struct NextFirst { 1: optional NextFirst next; 2: string label }
            struct Ring { 1: i32 id; 2: optional Link link }
            struct Link { 1: i32 id; 2: optional Ring ring }
            struct Holder { 1: Node node; 2: i32 count }
            struct LateMissing { 1: string label; 2: Missing missing }
            struct EarlyMissing { 1: Missing missing; 2: string label }
            struct Record {
                1: Label label
                2: UserId user
                3: base.Point at
                4: list<i32> items
                5: Status status
                6: base.Base Base
                7: Pair pair
                8: Choice choice
                9: binary blob
            }
        )IDL");

        auto parsed = frontend::parse_program(root.string());
        ASSERT_TRUE(parsed) << parsed.error();
        program = std::move(parsed.value());
    }

    void TearDown() override
    {
        std::error_code ec;
        std::filesystem::remove_all(temp_dir, ec);
    }

    std::filesystem::path WriteFile(const std::string& name, const std::string& content)
    {
        auto path = temp_dir / name;
        std::ofstream f(path);
        f << content;
        return path;
    }

    const ast::StructLike* Record(const std::string& name) const
    {
        for (const auto* record : ast::struct_likes_of(program.find(program.roots.front())->document)) {
            if (record->name == name) {
                return record;
            }
        }
        return nullptr;
    }
};

TEST_F(FieldLayoutWithTypes, ReorderResolvedTypes)
{
    golang::CodeUtils utils(program, "example.com/mod");
    auto scope = utils.build_scope(*program.find(program.roots.front()));
    ASSERT_TRUE(scope) << scope.error().to_string();
    utils.set_root_scope(*scope);

    const auto* record = Record("Record");
    ASSERT_NE(record, nullptr);

    auto ordered = reorder_fields(record->fields, [&utils](const ast::Type& type) {
        return utils.is_fixed_length_type(type);
    });
    ASSERT_TRUE(ordered) << ordered.error().to_string();
    EXPECT_EQ(names_of(*ordered), (std::vector<std::string>{"user", "at", "status", "pair", "label", "items",
                                                            "Base", "choice", "blob"}));
}

namespace
{

ast::Type user_type(const std::string& name)
{
    ast::UserType user;
    user.name.parts = {name};
    return user;
}

}  // namespace

TEST_F(FieldLayoutWithTypes, RecursiveRecordsAreVariableWidthInAnyFieldOrder)
{
    golang::CodeUtils utils(program, "");
    auto scope = utils.build_scope(*program.find(program.roots.front()));
    ASSERT_TRUE(scope) << scope.error().to_string();
    utils.set_root_scope(*scope);

    const auto is_fixed_width = [&utils](const ast::Type& type) {
        return utils.is_fixed_length_type(type);
    };

    for (const auto* name : {"Node", "LabelFirst", "NextFirst", "Ring", "Link"}) {
        const auto* record = Record(name);
        ASSERT_NE(record, nullptr) << name;
        ast::Type self = user_type(name);
        auto fixed = utils.is_fixed_length_type(self);
        ASSERT_TRUE(fixed) << name << ": " << fixed.error().to_string();
        EXPECT_FALSE(*fixed) << name;
    }

    auto label_first = reorder_fields(Record("LabelFirst")->fields, is_fixed_width);
    ASSERT_TRUE(label_first) << label_first.error().to_string();
    EXPECT_EQ(names_of(*label_first), (std::vector<std::string>{"label", "next"}));

    auto next_first = reorder_fields(Record("NextFirst")->fields, is_fixed_width);
    ASSERT_TRUE(next_first) << next_first.error().to_string();
    EXPECT_EQ(names_of(*next_first), (std::vector<std::string>{"next", "label"}));

    auto ring = reorder_fields(Record("Ring")->fields, is_fixed_width);
    ASSERT_TRUE(ring) << ring.error().to_string();
    EXPECT_EQ(names_of(*ring), (std::vector<std::string>{"id", "link"}));

    auto holder = reorder_fields(Record("Holder")->fields, is_fixed_width);
    ASSERT_TRUE(holder) << holder.error().to_string();
    EXPECT_EQ(names_of(*holder), (std::vector<std::string>{"count", "node"}));
}

TEST_F(FieldLayoutWithTypes, UnresolvedFieldFailsInAnyFieldOrder)
{
    golang::CodeUtils utils(program, "");
    auto scope = utils.build_scope(*program.find(program.roots.front()));
    ASSERT_TRUE(scope) << scope.error().to_string();
    utils.set_root_scope(*scope);

    for (const auto* name : {"LateMissing", "EarlyMissing"}) {
        ast::Type record = user_type(name);
        auto fixed = utils.is_fixed_length_type(record);
        ASSERT_FALSE(fixed) << name;
        EXPECT_EQ(fixed.error().kind(), ErrorKind::TypeClassification) << name;
        EXPECT_NE(fixed.error().message.find("Missing"), std::string::npos) << fixed.error().message;
    }

    auto ordered = reorder_fields(Record("LateMissing")->fields, [&utils](const ast::Type& type) {
        return utils.is_fixed_length_type(type);
    });
    ASSERT_FALSE(ordered);
    EXPECT_EQ(ordered.error().kind(), ErrorKind::TypeClassification);
}
