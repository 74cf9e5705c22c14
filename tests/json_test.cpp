#include "core/json.hpp"
#include "kinds/test_kinds.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

using tuid::core::FriendlyId;
using tuid::core::TypedId;
using tuid::core::Uuid;
using tuid_test::UserType;

TEST(Json, UuidAsString) {
  auto uuid = Uuid::parse("550e8400-e29b-41d4-a716-446655440000").value();
  nlohmann::json j = uuid;
  EXPECT_EQ(j, "550e8400-e29b-41d4-a716-446655440000");
  EXPECT_EQ(j.get<Uuid>(), uuid);
}

TEST(Json, TypedIdAsPlainString) {
  auto id = TypedId<UserType>::generate(UserType::Business);
  nlohmann::json j = id;
  ASSERT_TRUE(j.is_string());
  EXPECT_EQ(j.get<std::string>(), id.to_string());
  EXPECT_EQ(j.get<TypedId<UserType>>(), id);
}

TEST(Json, FriendlyIdAsPrefixedString) {
  auto friendly = FriendlyId<UserType>::generate(UserType::Organization);
  nlohmann::json doc{{"owner", friendly}};
  EXPECT_EQ(doc["owner"].get<std::string>(), friendly.to_string());

  auto back = doc["owner"].get<FriendlyId<UserType>>();
  EXPECT_EQ(back, friendly);
  EXPECT_EQ(back.kind(), UserType::Organization);
}

TEST(Json, RejectsInvalidIdentifiers) {
  nlohmann::json mismatched = "business_550e8400-e29b-8000-8000-000000000000";
  EXPECT_THROW(mismatched.get<FriendlyId<UserType>>(), std::invalid_argument);

  nlohmann::json unknown = "550e8400-e29b-8000-8000-0000000000ff";
  EXPECT_THROW(unknown.get<TypedId<UserType>>(), std::invalid_argument);

  nlohmann::json garbage = "not-a-uuid";
  EXPECT_THROW(garbage.get<Uuid>(), std::invalid_argument);
}
