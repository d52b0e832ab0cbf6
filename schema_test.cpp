#include "gtest/gtest.h"
#include "schema.hpp"

#include <string>
#include <vector>

#include "rapidjson/document.h"

using namespace fieldmap;

namespace {

std::vector<std::string> names_of(const FieldList& fields) {
    std::vector<std::string> names;
    for (const auto& field : fields) {
        names.push_back(field.name);
    }
    return names;
}

SchemaPtr build_or_fail(const SchemaBuilder& builder) {
    auto [schema, error] = builder.build();
    EXPECT_FALSE(error.has_error()) << format_error(error);
    return schema;
}

}

// Without meta the effective list is the declared list
TEST(SchemaTest, DeclarationOrder) {
    auto schema = build_or_fail(SchemaBuilder("UserSerializer")
        .field("email", char_field())
        .field("username", char_field())
        .field("age", integer_field()));
    ASSERT_NE(schema, nullptr);

    EXPECT_EQ(schema->name(), "UserSerializer");
    EXPECT_EQ(names_of(schema->effective_fields()), (std::vector<std::string>{"email", "username", "age"}));
    EXPECT_EQ(names_of(schema->declared_fields()), names_of(schema->effective_fields()));
    EXPECT_FALSE(schema->meta().has_value());
}

TEST(SchemaTest, RedeclaredNameKeepsItsSlot) {
    auto schema = build_or_fail(SchemaBuilder("S")
        .field("a", char_field())
        .field("b", char_field())
        .field("a", integer_field()));
    ASSERT_NE(schema, nullptr);

    EXPECT_EQ(names_of(schema->effective_fields()), (std::vector<std::string>{"a", "b"}));
    EXPECT_EQ(schema->find_field("a")->spec.kind(), FieldKind::INTEGER);
    EXPECT_EQ(schema->find_field("missing"), nullptr);
}

TEST(SchemaTest, InheritanceStableOverride) {
    auto base = build_or_fail(SchemaBuilder("Base")
        .field("id", integer_field())
        .field("name", char_field())
        .field("created", datetime_field()));
    auto mixin = build_or_fail(SchemaBuilder("Mixin")
        .field("tag", char_field())
        .field("id", char_field()));

    auto derived = build_or_fail(SchemaBuilder("Derived")
        .extends(base)
        .extends(mixin)
        .field("extra", boolean_field())
        .field("name", integer_field()));
    ASSERT_NE(derived, nullptr);

    EXPECT_EQ(names_of(derived->effective_fields()),
              (std::vector<std::string>{"id", "name", "created", "tag", "extra"}));
    EXPECT_EQ(derived->find_field("id")->spec.kind(), FieldKind::CHAR);
    EXPECT_EQ(derived->find_field("name")->spec.kind(), FieldKind::INTEGER);

    // Bases are unaffected
    EXPECT_EQ(base->find_field("name")->spec.kind(), FieldKind::CHAR);
}

TEST(SchemaTest, MetaIsNotInherited) {
    auto base = build_or_fail(SchemaBuilder("Base")
        .field("a", char_field())
        .field("b", char_field())
        .meta({{"a"}, {}}));
    auto derived = build_or_fail(SchemaBuilder("Derived").extends(base));
    ASSERT_NE(derived, nullptr);

    EXPECT_EQ(names_of(base->effective_fields()), (std::vector<std::string>{"a"}));
    EXPECT_EQ(names_of(derived->effective_fields()), (std::vector<std::string>{"a", "b"}));
}

TEST(MetaPolicyTest, AllowListKeepsDeclarationOrder) {
    FieldList declared = {{"a", char_field()}, {"b", char_field()}, {"c", char_field()}};
    auto [fields, error] = resolve_meta(declared, MetaPolicy{{"c", "a"}, {}});
    EXPECT_FALSE(error.has_error());
    EXPECT_EQ(names_of(fields), (std::vector<std::string>{"a", "c"}));
}

TEST(MetaPolicyTest, DenyList) {
    FieldList declared = {{"email", char_field()}, {"username", char_field()}};
    auto [fields, error] = resolve_meta(declared, MetaPolicy{{}, {"username"}});
    EXPECT_FALSE(error.has_error());
    EXPECT_EQ(names_of(fields), (std::vector<std::string>{"email"}));
}

TEST(MetaPolicyTest, EmptyPolicy) {
    FieldList declared = {{"email", char_field()}};
    auto [fields, error] = resolve_meta(declared, MetaPolicy{});
    EXPECT_FALSE(error.has_error());
    EXPECT_EQ(names_of(fields), (std::vector<std::string>{"email"}));
}

TEST(MetaPolicyTest, ConflictingMeta) {
    FieldList declared = {{"email", char_field()}, {"username", char_field()}};
    auto [fields, error] = resolve_meta(declared, MetaPolicy{{"email"}, {"username"}});
    EXPECT_EQ(error.code, SerializeError::ErrorCode::CONFLICTING_META);
    EXPECT_TRUE(fields.empty());

    auto [schema, build_error] = SchemaBuilder("S")
        .field("email", char_field())
        .field("username", char_field())
        .meta({{"email"}, {"username"}})
        .build();
    EXPECT_EQ(schema, nullptr);
    EXPECT_EQ(build_error.code, SerializeError::ErrorCode::CONFLICTING_META);
    EXPECT_NE(build_error.get_full_description().find("definition S"), std::string::npos);
}

TEST(MetaPolicyTest, UnknownField) {
    FieldList declared = {{"email", char_field()}};

    auto [allowed, allow_error] = resolve_meta(declared, MetaPolicy{{"nope"}, {}});
    EXPECT_EQ(allow_error.code, SerializeError::ErrorCode::UNKNOWN_FIELD);
    EXPECT_NE(allow_error.message.find("nope"), std::string::npos);

    auto [excluded, exclude_error] = resolve_meta(declared, MetaPolicy{{}, {"nope"}});
    EXPECT_EQ(exclude_error.code, SerializeError::ErrorCode::UNKNOWN_FIELD);
}

TEST(SchemaTest, InvalidDefinitions) {
    auto [unnamed, unnamed_error] = SchemaBuilder("S").field("", char_field()).build();
    EXPECT_EQ(unnamed, nullptr);
    EXPECT_EQ(unnamed_error.code, SerializeError::ErrorCode::INVALID_DEFINITION);

    auto [method, method_error] = SchemaBuilder("S").field("computed", method_field(nullptr)).build();
    EXPECT_EQ(method, nullptr);
    EXPECT_EQ(method_error.code, SerializeError::ErrorCode::INVALID_DEFINITION);
    EXPECT_EQ(method_error.path, "computed");

    auto [orphan, orphan_error] = SchemaBuilder("S").extends(nullptr).build();
    EXPECT_EQ(orphan, nullptr);
    EXPECT_EQ(orphan_error.code, SerializeError::ErrorCode::INVALID_DEFINITION);

    auto [unbound, unbound_error] = SchemaBuilder("S").field("author", nested_field(nullptr)).build();
    EXPECT_EQ(unbound, nullptr);
    EXPECT_EQ(unbound_error.code, SerializeError::ErrorCode::INVALID_DEFINITION);
    EXPECT_EQ(unbound_error.path, "author");
    EXPECT_NE(unbound_error.message.find("no definition"), std::string::npos);

    auto [tree, tree_error] = SchemaBuilder("Node").field("children", self_field(true)).build();
    EXPECT_NE(tree, nullptr);
    EXPECT_FALSE(tree_error.has_error());
}

TEST(SchemaTest, DescribeSchema) {
    FieldOptions email_options;
    email_options.label = "E-mail";
    email_options.help_text = "Primary address";

    FieldOptions nickname_options;
    nickname_options.required = false;

    auto profile = build_or_fail(SchemaBuilder("ProfileSerializer").field("bio", char_field()));
    auto schema = build_or_fail(SchemaBuilder("UserSerializer")
        .field("email", char_field(email_options))
        .field("nickname", char_field(nickname_options))
        .field("joined", date_field())
        .field("profile", nested_field(profile))
        .field("secret", char_field())
        .meta({{}, {"secret"}}));
    ASSERT_NE(schema, nullptr);

    rapidjson::Document document;
    describe_schema(*schema, document, document.GetAllocator());

    ASSERT_TRUE(document.IsObject());
    EXPECT_EQ(document.MemberCount(), 4u);
    EXPECT_FALSE(document.HasMember("secret"));

    EXPECT_STREQ(document["email"]["type"].GetString(), "string");
    EXPECT_STREQ(document["email"]["type_name"].GetString(), "CharField");
    EXPECT_TRUE(document["email"]["required"].GetBool());
    EXPECT_STREQ(document["email"]["label"].GetString(), "E-mail");
    EXPECT_STREQ(document["email"]["help_text"].GetString(), "Primary address");

    EXPECT_FALSE(document["nickname"]["required"].GetBool());
    EXPECT_FALSE(document["nickname"].HasMember("label"));

    EXPECT_STREQ(document["joined"]["type"].GetString(), "date");
    EXPECT_STREQ(document["profile"]["type"].GetString(), "object");
    EXPECT_STREQ(document["profile"]["type_name"].GetString(), "ProfileSerializer");

    // Members follow the effective field order
    auto it = document.MemberBegin();
    EXPECT_STREQ(it->name.GetString(), "email");
    EXPECT_STREQ((it + 3)->name.GetString(), "profile");
}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
