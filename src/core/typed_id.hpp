#pragma once

#include <compare>
#include <cstdint>
#include <format>
#include <functional>
#include <stdexcept>
#include <string>
#include <string_view>

#include "core/error.hpp"
#include "core/kind.hpp"
#include "core/layout.hpp"
#include "core/uuid.hpp"

namespace tuid::core {

/// A 128-bit identifier that carries its kind in the tag byte.
///
/// Values only come from `generate` (fresh random bits for a kind) or from the
/// validating factories, so the tag byte of a `TypedId` always names a kind.
/// The type is a plain immutable value: copy it, compare it, hash it.
template <KindDescriptor K>
class TypedId {
public:
  using Kind = K;

  /// New random identifier for `kind`. Throws `std::logic_error` when the
  /// descriptor cannot decode `kind`'s own tag.
  static auto generate(K kind) -> TypedId {
    const auto tag = KindTraits<K>::tag(kind);
    if (!kind_round_trips(kind)) {
      throw std::logic_error(std::format("{}: tag {} does not decode back to its kind",
                                         kind_type_name<K>(), tag));
    }
    return TypedId(make_tagged_uuid(tag));
  }

  /// Adopt an existing identifier. Fails with `UnknownTag` when no kind
  /// claims its tag byte.
  static auto from_uuid(const Uuid& uuid) -> Expected<TypedId> {
    const auto tag = tag_of(uuid);
    if (!KindTraits<K>::from_tag(tag)) {
      return tl::unexpected(unknown_tag_error(tag));
    }
    return TypedId(uuid);
  }

  static auto from_bytes(const Uuid::Bytes& bytes) -> Expected<TypedId> {
    return from_uuid(Uuid(bytes));
  }

  /// Parse the plain hyphenated form (no name prefix).
  static auto parse(std::string_view text) -> Expected<TypedId> {
    auto uuid = Uuid::parse(text);
    if (!uuid) {
      return tl::unexpected(uuid.error());
    }
    return from_uuid(*uuid);
  }

  /// Decode the kind stored in the tag byte.
  auto kind() const -> Expected<K> {
    auto kind = KindTraits<K>::from_tag(tag());
    if (!kind) {
      return tl::unexpected(unknown_tag_error(tag()));
    }
    return *kind;
  }

  auto tag() const -> std::uint8_t { return tag_of(uuid_); }
  auto uuid() const -> const Uuid& { return uuid_; }
  auto bytes() const -> const Uuid::Bytes& { return uuid_.bytes(); }
  auto to_string() const -> std::string { return uuid_.to_string(); }

  auto operator<=>(const TypedId&) const = default;

private:
  explicit TypedId(const Uuid& uuid) : uuid_(uuid) {}

  static auto unknown_tag_error(std::uint8_t tag) -> IdError {
    return make_error(IdErrorCode::UnknownTag,
                      std::format("invalid tag {} for kind type {}", tag,
                                  kind_type_name<K>()));
  }

  Uuid uuid_;
};

}  // namespace tuid::core

template <tuid::core::KindDescriptor K>
struct std::hash<tuid::core::TypedId<K>> {
  auto operator()(const tuid::core::TypedId<K>& id) const -> std::size_t {
    return std::hash<tuid::core::Uuid>{}(id.uuid());
  }
};

template <tuid::core::KindDescriptor K>
struct std::formatter<tuid::core::TypedId<K>> : std::formatter<std::string> {
  auto format(const tuid::core::TypedId<K>& id, std::format_context& ctx) const {
    return formatter<std::string>::format(id.to_string(), ctx);
  }
};
