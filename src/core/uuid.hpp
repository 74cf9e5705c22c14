#pragma once

#include <array>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <format>
#include <functional>
#include <span>
#include <string>
#include <string_view>

#include "core/error.hpp"

namespace tuid::core {

/// Fill `out` from the cryptographically strong per-thread source.
auto fill_random(std::span<std::uint8_t> out) -> void;

/// A 128-bit identifier in the standard (RFC 9562) byte order.
class Uuid {
public:
  using Bytes = std::array<std::uint8_t, 16>;

  static constexpr std::size_t kSize = 16;
  /// Length of the hyphenated 8-4-4-4-12 text form.
  static constexpr std::size_t kTextSize = 36;

  /// The nil UUID (all zero bits).
  constexpr Uuid() = default;
  explicit constexpr Uuid(const Bytes& bytes) : bytes_(bytes) {}

  /// 16 random bytes, no version or variant bits applied.
  static auto random() -> Uuid;

  /// Parse the hyphenated text form. Hex digits may be upper or lower case.
  static auto parse(std::string_view text) -> Expected<Uuid>;

  /// Lowercase hyphenated text form.
  auto to_string() const -> std::string;

  auto bytes() const -> const Bytes& { return bytes_; }
  /// High nibble of byte 6.
  auto version() const -> std::uint8_t { return bytes_[6] >> 4; }
  /// Top two bits of byte 8.
  auto variant() const -> std::uint8_t { return bytes_[8] >> 6; }
  auto is_nil() const -> bool;

  auto operator<=>(const Uuid&) const = default;

private:
  Bytes bytes_{};
};

}  // namespace tuid::core

template <>
struct std::hash<tuid::core::Uuid> {
  auto operator()(const tuid::core::Uuid& uuid) const -> std::size_t {
    std::size_t h = 0;
    for (auto byte : uuid.bytes()) {
      h = h * 131 + byte;
    }
    return h;
  }
};

template <>
struct std::formatter<tuid::core::Uuid> : std::formatter<std::string> {
  auto format(const tuid::core::Uuid& uuid, std::format_context& ctx) const {
    return formatter<std::string>::format(uuid.to_string(), ctx);
  }
};
