#include "codegen/validate.hpp"

#include <gtest/gtest.h>

#include <format>
#include <set>

using tuid::codegen::CodegenErrorCode;
using tuid::codegen::derive_kind_table;
using tuid::codegen::EnumDecl;
using tuid::codegen::Json;
using tuid::codegen::parse_enum_decl;

namespace {

auto decl_from(const char* text) -> EnumDecl {
  auto decl = parse_enum_decl(Json::parse(text));
  EXPECT_TRUE(decl) << text;
  return decl.value_or(EnumDecl{});
}

auto enum_with_variants(std::size_t count) -> EnumDecl {
  EnumDecl decl;
  decl.name = "Many";
  for (std::size_t i = 0; i < count; ++i) {
    decl.variants.push_back({std::format("V{:03}", i), false, {}});
  }
  return decl;
}

}  // namespace

TEST(Validate, AssignsPositionalTagsAndNames) {
  auto table = derive_kind_table(decl_from(R"JSON({
    "name": "UserType",
    "namespace": "app",
    "variants": [
      "Retail",
      "Business",
      { "name": "Organization", "attributes": { "prefix": "org" } },
      "HTTPServer"
    ]
  })JSON"));
  ASSERT_TRUE(table) << table.error().message;
  EXPECT_EQ(table->qualified_name(), "app::UserType");
  ASSERT_EQ(table->entries.size(), 4u);

  EXPECT_EQ(table->entries[0].variant, "Retail");
  EXPECT_EQ(table->entries[0].tag, 0);
  EXPECT_EQ(table->entries[0].name, "retail");
  EXPECT_FALSE(table->entries[0].overridden);

  EXPECT_EQ(table->entries[1].tag, 1);
  EXPECT_EQ(table->entries[1].name, "business");

  EXPECT_EQ(table->entries[2].tag, 2);
  EXPECT_EQ(table->entries[2].name, "org");
  EXPECT_TRUE(table->entries[2].overridden);

  EXPECT_EQ(table->entries[3].tag, 3);
  EXPECT_EQ(table->entries[3].name, "http_server");
}

TEST(Validate, RecordIsNotEnum) {
  auto table = derive_kind_table(decl_from(R"JSON(
    { "name": "NotAnEnum", "kind": "struct", "fields": [ { "name": "id", "type": "std::uint32_t" } ] }
  )JSON"));
  ASSERT_FALSE(table);
  EXPECT_EQ(table.error().code, CodegenErrorCode::NotEnum);
  EXPECT_EQ(table.error().message, "KindDescriptor can only be derived for enums");
  EXPECT_EQ(table.error().subject, "NotAnEnum");

  auto as_union = derive_kind_table(decl_from(R"JSON({ "name": "U", "kind": "union" })JSON"));
  ASSERT_FALSE(as_union);
  EXPECT_EQ(as_union.error().code, CodegenErrorCode::NotEnum);
}

TEST(Validate, EmptyEnum) {
  auto table = derive_kind_table(decl_from(R"JSON({ "name": "EmptyEnum", "variants": [] })JSON"));
  ASSERT_FALSE(table);
  EXPECT_EQ(table.error().code, CodegenErrorCode::EmptyEnum);
  EXPECT_EQ(table.error().message,
            "KindDescriptor cannot be derived for empty enums (at least one variant required)");
}

TEST(Validate, DataCarryingVariant) {
  auto table = derive_kind_table(decl_from(R"JSON({
    "name": "HasTupleVariant",
    "variants": [ "Unit", { "name": "Tuple", "fields": ["std::int32_t"] }, "AlsoUnit" ]
  })JSON"));
  ASSERT_FALSE(table);
  EXPECT_EQ(table.error().code, CodegenErrorCode::NonUnitVariant);
  EXPECT_EQ(table.error().subject, "HasTupleVariant::Tuple");
  EXPECT_EQ(table.error().message,
            "KindDescriptor can only be derived for enums with unit variants (no fields)");
}

TEST(Validate, VariantCountLimit) {
  auto full = derive_kind_table(enum_with_variants(256));
  ASSERT_TRUE(full);
  EXPECT_EQ(full->entries.back().tag, 255);
  EXPECT_EQ(full->entries.back().name, "v255");

  auto too_many = derive_kind_table(enum_with_variants(257));
  ASSERT_FALSE(too_many);
  EXPECT_EQ(too_many.error().code, CodegenErrorCode::TooManyVariants);
  EXPECT_EQ(too_many.error().message,
            "KindDescriptor can only be derived for enums with at most 256 variants");
}

TEST(Validate, UnknownAttributeKeyIsNamed) {
  auto table = derive_kind_table(decl_from(R"JSON({
    "name": "EntityType",
    "variants": [ { "name": "User", "attributes": { "prfx": "usr" } }, "Admin" ]
  })JSON"));
  ASSERT_FALSE(table);
  EXPECT_EQ(table.error().code, CodegenErrorCode::UnknownAttributeKey);
  EXPECT_EQ(table.error().subject, "EntityType::User");
  EXPECT_EQ(table.error().message, "unknown kind attribute `prfx`. Expected `prefix = \"...\"`");
}

TEST(Validate, PrefixMustBeNonEmptyString) {
  for (const char* text : {
           R"JSON({ "name": "E", "variants": [ { "name": "A", "attributes": { "prefix": "" } } ] })JSON",
           R"JSON({ "name": "E", "variants": [ { "name": "A", "attributes": { "prefix": 7 } } ] })JSON",
       }) {
    auto table = derive_kind_table(decl_from(text));
    ASSERT_FALSE(table) << text;
    EXPECT_EQ(table.error().code, CodegenErrorCode::InvalidAttributeValue) << text;
  }
}

TEST(Validate, PrefixRejectsControlCharacters) {
  auto table = derive_kind_table(decl_from(
      R"JSON({ "name": "E", "variants": [ { "name": "A", "attributes": { "prefix": "a\r\nb" } } ] })JSON"));
  ASSERT_FALSE(table);
  EXPECT_EQ(table.error().code, CodegenErrorCode::InvalidAttributeValue);
  EXPECT_EQ(table.error().subject, "E::A");
  EXPECT_EQ(table.error().message, "kind attribute `prefix` must not contain control characters");
}

TEST(Validate, ChecksRunInOrder) {
  // Shape errors win over attribute errors.
  auto shape_first = derive_kind_table(decl_from(R"JSON({
    "name": "E",
    "variants": [ { "name": "A", "attributes": { "bogus": 1 } }, { "name": "B", "fields": [] } ]
  })JSON"));
  ASSERT_FALSE(shape_first);
  EXPECT_EQ(shape_first.error().code, CodegenErrorCode::NonUnitVariant);

  // A data-carrying variant is reported before the count limit.
  auto decl = enum_with_variants(300);
  decl.variants[299].has_fields = true;
  auto unit_first = derive_kind_table(decl);
  ASSERT_FALSE(unit_first);
  EXPECT_EQ(unit_first.error().code, CodegenErrorCode::NonUnitVariant);
}

TEST(Validate, DuplicateNamesAreAllowed) {
  auto table = derive_kind_table(decl_from(R"JSON({
    "name": "E",
    "variants": [ "Retail", { "name": "Shop", "attributes": { "prefix": "retail" } } ]
  })JSON"));
  ASSERT_TRUE(table);
  EXPECT_EQ(table->entries[0].name, table->entries[1].name);
  EXPECT_NE(table->entries[0].tag, table->entries[1].tag);
}

TEST(Validate, TagsFormBijection) {
  auto table = derive_kind_table(enum_with_variants(40));
  ASSERT_TRUE(table);
  std::set<int> tags;
  for (std::size_t i = 0; i < table->entries.size(); ++i) {
    EXPECT_EQ(table->entries[i].tag, i);
    tags.insert(table->entries[i].tag);
  }
  EXPECT_EQ(tags.size(), table->entries.size());
}
