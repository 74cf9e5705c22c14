#pragma once

#include <cstddef>
#include <format>
#include <functional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "core/error.hpp"
#include "core/kind.hpp"
#include "core/typed_id.hpp"
#include "core/uuid.hpp"

namespace tuid::core {

/// Human-readable projection of a `TypedId`: `{name}_{uuid}`.
///
/// The name is derived from the identifier's kind and never stored on its
/// own; the `TypedId` stays the source of truth.
template <KindDescriptor K>
class FriendlyId {
public:
  /// Shortest valid text: a one-character name, the separator and a UUID.
  static constexpr std::size_t kMinTextSize = Uuid::kTextSize + 2;
  static constexpr char kSeparator = '_';

  explicit FriendlyId(const TypedId<K>& id) : FriendlyId(id, resolve(id)) {}

  static auto generate(K kind) -> FriendlyId {
    return FriendlyId(TypedId<K>::generate(kind), kind);
  }

  /// Parse `{name}_{uuid}`. The UUID is located from the end of the text
  /// because names may contain underscores.
  static auto parse(std::string_view text) -> Expected<FriendlyId> {
    if (text.size() < kMinTextSize) {
      return tl::unexpected(make_error(
          IdErrorCode::InvalidFormat,
          std::format("expected format 'name_uuid' of at least {} characters, found {}",
                      kMinTextSize, text.size())));
    }
    const auto split = text.size() - Uuid::kTextSize;
    if (text[split - 1] != kSeparator) {
      return tl::unexpected(make_error(
          IdErrorCode::InvalidFormat,
          std::format("expected '{}' before the trailing {} characters, found '{}'",
                      kSeparator, Uuid::kTextSize, text[split - 1])));
    }
    const auto name = text.substr(0, split - 1);

    auto id = TypedId<K>::parse(text.substr(split));
    if (!id) {
      return tl::unexpected(id.error());
    }

    auto kind = id->kind();
    if (!kind) {
      return tl::unexpected(kind.error());
    }
    FriendlyId friendly(*id, *kind);
    if (friendly.name_ != name) {
      return tl::unexpected(make_error(
          IdErrorCode::PrefixMismatch,
          std::format("prefix '{}' does not match kind '{}' of type {}", name,
                      friendly.name_, kind_type_name<K>())));
    }
    return friendly;
  }

  auto typed_id() const -> const TypedId<K>& { return id_; }
  auto uuid() const -> const Uuid& { return id_.uuid(); }
  auto name() const -> const std::string& { return name_; }

  auto kind() const -> K { return kind_; }

  auto to_string() const -> std::string {
    std::string out;
    out.reserve(name_.size() + 1 + Uuid::kTextSize);
    out.append(name_);
    out.push_back(kSeparator);
    out.append(id_.to_string());
    return out;
  }

  auto operator==(const FriendlyId& other) const -> bool { return id_ == other.id_; }

private:
  FriendlyId(const TypedId<K>& id, K kind) : id_(id), kind_(kind), name_(kind_name(kind)) {}

  static auto resolve(const TypedId<K>& id) -> K {
    auto kind = id.kind();
    if (!kind) {
      throw std::logic_error(kind.error().message);
    }
    return *kind;
  }

  TypedId<K> id_;
  K kind_;
  std::string name_;
};

}  // namespace tuid::core

template <tuid::core::KindDescriptor K>
struct std::hash<tuid::core::FriendlyId<K>> {
  auto operator()(const tuid::core::FriendlyId<K>& id) const -> std::size_t {
    return std::hash<tuid::core::TypedId<K>>{}(id.typed_id());
  }
};

template <tuid::core::KindDescriptor K>
struct std::formatter<tuid::core::FriendlyId<K>> : std::formatter<std::string> {
  auto format(const tuid::core::FriendlyId<K>& id, std::format_context& ctx) const {
    return formatter<std::string>::format(id.to_string(), ctx);
  }
};
