#include "core/typed_id.hpp"
#include "kinds/test_kinds.hpp"

#include <gtest/gtest.h>

#include <unordered_set>

using tuid::core::IdErrorCode;
using tuid::core::TypedId;
using tuid::core::Uuid;
using tuid_test::UserType;

namespace {

constexpr UserType kAllUserTypes[] = {UserType::Retail, UserType::Business,
                                      UserType::Organization};

auto uuid_with_tag(std::uint8_t tag) -> Uuid {
  Uuid::Bytes bytes{0x55, 0x0e, 0x84, 0x00, 0xe2, 0x9b, 0x80, 0x00,
                    0x80, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00};
  bytes[15] = tag;
  return Uuid(bytes);
}

}  // namespace

TEST(TypedId, BinaryRoundTrip) {
  for (auto kind : kAllUserTypes) {
    auto id = TypedId<UserType>::generate(kind);
    auto decoded = id.kind();
    ASSERT_TRUE(decoded);
    EXPECT_EQ(*decoded, kind);

    auto copy = TypedId<UserType>::from_bytes(id.bytes());
    ASSERT_TRUE(copy);
    EXPECT_EQ(*copy, id);
    EXPECT_EQ(copy->kind().value(), kind);
  }
}

TEST(TypedId, TagByteMatchesDescriptor) {
  for (auto kind : kAllUserTypes) {
    auto id = TypedId<UserType>::generate(kind);
    EXPECT_EQ(id.tag(), tuid::core::kind_tag(kind));
    EXPECT_EQ(id.bytes()[15], tuid::core::kind_tag(kind));
  }
}

TEST(TypedId, LayoutMarkersAlwaysSet) {
  for (int i = 0; i < 500; ++i) {
    auto id = TypedId<UserType>::generate(kAllUserTypes[i % 3]);
    EXPECT_EQ(id.bytes()[6] >> 4, 8);
    EXPECT_EQ(id.bytes()[8] >> 6, 0b10);
    EXPECT_EQ(id.uuid().version(), 8);
  }
}

TEST(TypedId, GeneratedValuesAreUnique) {
  std::unordered_set<TypedId<UserType>> seen;
  for (int i = 0; i < 1000; ++i) {
    seen.insert(TypedId<UserType>::generate(UserType::Retail));
  }
  EXPECT_EQ(seen.size(), 1000u);
}

TEST(TypedId, FromUuidRejectsUnknownTag) {
  auto id = TypedId<UserType>::from_uuid(uuid_with_tag(3));
  ASSERT_FALSE(id);
  EXPECT_EQ(id.error().code, IdErrorCode::UnknownTag);
  EXPECT_NE(id.error().message.find("tuid_test::UserType"), std::string::npos);

  EXPECT_FALSE(TypedId<UserType>::from_uuid(uuid_with_tag(255)));
  EXPECT_TRUE(TypedId<UserType>::from_uuid(uuid_with_tag(2)));
}

TEST(TypedId, ParsePlainText) {
  auto id = TypedId<UserType>::parse("550e8400-e29b-8000-8000-000000000001");
  ASSERT_TRUE(id);
  EXPECT_EQ(id->kind().value(), UserType::Business);
  EXPECT_EQ(id->to_string(), "550e8400-e29b-8000-8000-000000000001");

  auto bad = TypedId<UserType>::parse("550e8400-e29b-8000-8000-00000000000z");
  ASSERT_FALSE(bad);
  EXPECT_EQ(bad.error().code, IdErrorCode::InvalidUuid);

  auto unknown = TypedId<UserType>::parse("550e8400-e29b-8000-8000-000000000009");
  ASSERT_FALSE(unknown);
  EXPECT_EQ(unknown.error().code, IdErrorCode::UnknownTag);
}

TEST(TypedId, OrderingFollowsRawBytes) {
  auto low = TypedId<UserType>::parse("00000000-0000-8000-8000-000000000000");
  auto high = TypedId<UserType>::parse("ff000000-0000-8000-8000-000000000000");
  ASSERT_TRUE(low && high);
  EXPECT_LT(*low, *high);
  EXPECT_NE(*low, *high);
}

TEST(TypedId, FormatsAsPlainUuid) {
  auto id = TypedId<UserType>::generate(UserType::Organization);
  EXPECT_EQ(std::format("{}", id), id.uuid().to_string());
  EXPECT_EQ(id.to_string().size(), Uuid::kTextSize);
}

TEST(TypedId, SameBytesDifferentKindTypes) {
  // Tag 0 is valid for both kind sets, so the bytes decode under either.
  auto as_user = TypedId<UserType>::from_uuid(uuid_with_tag(0));
  auto as_protocol = TypedId<tuid_test::ProtocolType>::from_uuid(uuid_with_tag(0));
  ASSERT_TRUE(as_user && as_protocol);
  EXPECT_EQ(as_user->kind().value(), UserType::Retail);
  EXPECT_EQ(as_protocol->kind().value(), tuid_test::ProtocolType::HTTPServer);

  EXPECT_FALSE(TypedId<tuid_test::SingletonType>::from_uuid(uuid_with_tag(1)));
}
