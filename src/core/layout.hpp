#pragma once

#include <cstddef>
#include <cstdint>

#include "core/uuid.hpp"

namespace tuid::core {

/// Byte positions inside a typed identifier (0 = most significant byte).
///
/// Byte 6 high nibble is the version marker (8, application-defined layout),
/// byte 8 top two bits are the variant marker `10`, byte 15 is the kind tag.
/// Every other bit is random.
inline constexpr std::size_t kVersionByte = 6;
inline constexpr std::size_t kVariantByte = 8;
inline constexpr std::size_t kTagByte = 15;

inline constexpr std::uint8_t kLayoutVersion = 8;
inline constexpr std::uint8_t kVariantMarker = 0b10;

/// Number of bits left to the random source.
inline constexpr int kRandomBits = 128 - 4 - 2 - 8;

/// Fresh random identifier with the version/variant markers set and `tag`
/// stored in the tag byte.
auto make_tagged_uuid(std::uint8_t tag) -> Uuid;

/// Stamp the markers and `tag` onto existing bytes.
auto apply_tagged_layout(Uuid::Bytes& bytes, std::uint8_t tag) -> void;

inline auto tag_of(const Uuid& uuid) -> std::uint8_t {
  return uuid.bytes()[kTagByte];
}

/// True when both the version and the variant markers are present.
auto has_tagged_layout(const Uuid& uuid) -> bool;

}  // namespace tuid::core
