#include "core/layout.hpp"

namespace tuid::core {

auto apply_tagged_layout(Uuid::Bytes& bytes, std::uint8_t tag) -> void {
  bytes[kVersionByte] = static_cast<std::uint8_t>(
      (bytes[kVersionByte] & 0x0Fu) | (kLayoutVersion << 4));
  bytes[kVariantByte] = static_cast<std::uint8_t>(
      (bytes[kVariantByte] & 0x3Fu) | (kVariantMarker << 6));
  bytes[kTagByte] = tag;
}

auto make_tagged_uuid(std::uint8_t tag) -> Uuid {
  Uuid::Bytes bytes{};
  fill_random(bytes);
  apply_tagged_layout(bytes, tag);
  return Uuid(bytes);
}

auto has_tagged_layout(const Uuid& uuid) -> bool {
  return uuid.version() == kLayoutVersion && uuid.variant() == kVariantMarker;
}

}  // namespace tuid::core
