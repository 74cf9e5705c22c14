#pragma once

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <format>
#include <limits>
#include <optional>
#include <span>
#include <string>
#include <string_view>

#include "core/error.hpp"

namespace tuid::core {

/// Describes a closed set of kinds. Specialised per kind type, either by the
/// `tuid_gen` generator or by hand:
///
///   template <> struct tuid::core::KindTraits<MyKind> {
///     static constexpr std::string_view type_name = "MyKind";
///     static auto tag(MyKind kind) -> std::uint8_t;
///     static auto from_tag(std::uint8_t tag) -> std::optional<MyKind>;
///     static auto name(MyKind kind) -> std::string_view;
///   };
template <typename K>
struct KindTraits;

template <typename K>
concept KindDescriptor = std::equality_comparable<K> && requires(K kind, std::uint8_t tag) {
  { KindTraits<K>::tag(kind) } -> std::same_as<std::uint8_t>;
  { KindTraits<K>::from_tag(tag) } -> std::same_as<std::optional<K>>;
  { KindTraits<K>::name(kind) } -> std::convertible_to<std::string_view>;
};

template <typename K>
concept NamedKindDescriptor = KindDescriptor<K> && requires {
  { KindTraits<K>::type_name } -> std::convertible_to<std::string_view>;
};

template <KindDescriptor K>
constexpr auto kind_type_name() -> std::string_view {
  if constexpr (NamedKindDescriptor<K>) {
    return KindTraits<K>::type_name;
  } else {
    return "<unnamed kind>";
  }
}

template <KindDescriptor K>
auto kind_tag(K kind) -> std::uint8_t {
  return KindTraits<K>::tag(kind);
}

template <KindDescriptor K>
auto kind_from_tag(std::uint8_t tag) -> std::optional<K> {
  return KindTraits<K>::from_tag(tag);
}

/// Owned copy of the kind's name; hand-written descriptors may return
/// temporaries.
template <KindDescriptor K>
auto kind_name(K kind) -> std::string {
  return std::string(std::string_view(KindTraits<K>::name(kind)));
}

/// True when `kind`'s tag decodes back to `kind`.
template <KindDescriptor K>
auto kind_round_trips(K kind) -> bool {
  auto back = KindTraits<K>::from_tag(KindTraits<K>::tag(kind));
  return back && *back == kind;
}

/// Start-up check for descriptors that were written by hand: every tag that
/// resolves to a kind must map back to itself and carry a non-empty name.
/// Returns the number of assigned tags.
template <KindDescriptor K>
auto verify_kind_descriptor() -> Expected<std::size_t> {
  std::size_t assigned = 0;
  for (unsigned value = 0; value <= std::numeric_limits<std::uint8_t>::max(); ++value) {
    const auto tag = static_cast<std::uint8_t>(value);
    auto kind = KindTraits<K>::from_tag(tag);
    if (!kind) {
      continue;
    }
    const auto back = KindTraits<K>::tag(*kind);
    if (back != tag) {
      return tl::unexpected(make_error(
          IdErrorCode::InvalidDescriptor,
          std::format("{}: tag {} resolves to a kind whose tag is {}",
                      kind_type_name<K>(), value, back)));
    }
    if (kind_name(*kind).empty()) {
      return tl::unexpected(make_error(
          IdErrorCode::InvalidDescriptor,
          std::format("{}: kind with tag {} has an empty name", kind_type_name<K>(), value)));
    }
    ++assigned;
  }
  if (assigned == 0) {
    return tl::unexpected(make_error(
        IdErrorCode::InvalidDescriptor,
        std::format("{}: no tag resolves to a kind", kind_type_name<K>())));
  }
  return assigned;
}

/// As above, and additionally checks the other direction for the kinds the
/// application hands out: each one's tag must decode back to it.
template <KindDescriptor K>
auto verify_kind_descriptor(std::span<const K> kinds) -> Expected<std::size_t> {
  auto assigned = verify_kind_descriptor<K>();
  if (!assigned) {
    return assigned;
  }
  for (const auto kind : kinds) {
    if (!kind_round_trips(kind)) {
      return tl::unexpected(make_error(
          IdErrorCode::InvalidDescriptor,
          std::format("{}: kind '{}' has tag {} which does not decode back to it",
                      kind_type_name<K>(), kind_name(kind), KindTraits<K>::tag(kind))));
    }
  }
  return assigned;
}

}  // namespace tuid::core
