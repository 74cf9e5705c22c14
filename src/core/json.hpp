#pragma once

#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

#include "core/friendly_id.hpp"
#include "core/typed_id.hpp"
#include "core/uuid.hpp"

// JSON conversions. Identifiers travel as strings: `Uuid` and `TypedId` use
// the plain hyphenated form, `FriendlyId` uses `{name}_{uuid}`. Reading
// validates exactly like the corresponding `parse`.

namespace nlohmann {

template <>
struct adl_serializer<tuid::core::Uuid> {
  static auto to_json(json& j, const tuid::core::Uuid& uuid) -> void {
    j = uuid.to_string();
  }

  static auto from_json(const json& j, tuid::core::Uuid& uuid) -> void {
    auto parsed = tuid::core::Uuid::parse(j.get<std::string>());
    if (!parsed) {
      throw std::invalid_argument(parsed.error().message);
    }
    uuid = *parsed;
  }
};

// TypedId and FriendlyId have no default state, so they use the
// non-default-constructible serializer form.
template <tuid::core::KindDescriptor K>
struct adl_serializer<tuid::core::TypedId<K>> {
  static auto to_json(json& j, const tuid::core::TypedId<K>& id) -> void {
    j = id.to_string();
  }

  static auto from_json(const json& j) -> tuid::core::TypedId<K> {
    auto parsed = tuid::core::TypedId<K>::parse(j.get<std::string>());
    if (!parsed) {
      throw std::invalid_argument(parsed.error().message);
    }
    return *parsed;
  }
};

template <tuid::core::KindDescriptor K>
struct adl_serializer<tuid::core::FriendlyId<K>> {
  static auto to_json(json& j, const tuid::core::FriendlyId<K>& id) -> void {
    j = id.to_string();
  }

  static auto from_json(const json& j) -> tuid::core::FriendlyId<K> {
    auto parsed = tuid::core::FriendlyId<K>::parse(j.get<std::string>());
    if (!parsed) {
      throw std::invalid_argument(parsed.error().message);
    }
    return *parsed;
  }
};

}  // namespace nlohmann
