#include "core/uuid.hpp"

#include <algorithm>
#include <random>

namespace tuid::core {
namespace {

constexpr std::array<std::size_t, 4> kHyphenPositions{8, 13, 18, 23};
constexpr char kHexDigits[] = "0123456789abcdef";

auto is_hyphen_position(std::size_t pos) -> bool {
  return std::find(kHyphenPositions.begin(), kHyphenPositions.end(), pos) !=
         kHyphenPositions.end();
}

auto hex_value(char c) -> int {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

}  // namespace

auto fill_random(std::span<std::uint8_t> out) -> void {
  // One device per thread: no lock, no shared state between generators.
  // libstdc++ backs the default token with getrandom/rdrand.
  static thread_local std::random_device device;

  std::size_t offset = 0;
  while (offset < out.size()) {
    auto word = static_cast<std::uint32_t>(device());
    for (int i = 0; i < 4 && offset < out.size(); ++i) {
      out[offset++] = static_cast<std::uint8_t>(word & 0xFFu);
      word >>= 8;
    }
  }
}

auto Uuid::random() -> Uuid {
  Bytes bytes{};
  fill_random(bytes);
  return Uuid(bytes);
}

auto Uuid::parse(std::string_view text) -> Expected<Uuid> {
  if (text.size() != kTextSize) {
    return tl::unexpected(make_error(
        IdErrorCode::InvalidUuid,
        std::format("invalid length: expected {} characters, found {}",
                    kTextSize, text.size())));
  }

  Bytes bytes{};
  std::size_t byte_index = 0;
  std::size_t pos = 0;
  while (pos < text.size()) {
    if (is_hyphen_position(pos)) {
      if (text[pos] != '-') {
        return tl::unexpected(make_error(
            IdErrorCode::InvalidUuid,
            std::format("expected '-' at position {}, found '{}'", pos, text[pos])));
      }
      ++pos;
      continue;
    }
    const int high = hex_value(text[pos]);
    if (high < 0) {
      return tl::unexpected(make_error(
          IdErrorCode::InvalidUuid,
          std::format("invalid character '{}' at position {}", text[pos], pos)));
    }
    // Hyphens never sit between the two digits of a byte.
    const int low = hex_value(text[pos + 1]);
    if (low < 0) {
      return tl::unexpected(make_error(
          IdErrorCode::InvalidUuid,
          std::format("invalid character '{}' at position {}", text[pos + 1], pos + 1)));
    }
    bytes[byte_index++] = static_cast<std::uint8_t>((high << 4) | low);
    pos += 2;
  }
  return Uuid(bytes);
}

auto Uuid::to_string() const -> std::string {
  std::string out;
  out.reserve(kTextSize);
  for (std::size_t i = 0; i < bytes_.size(); ++i) {
    if (i == 4 || i == 6 || i == 8 || i == 10) {
      out.push_back('-');
    }
    out.push_back(kHexDigits[bytes_[i] >> 4]);
    out.push_back(kHexDigits[bytes_[i] & 0x0F]);
  }
  return out;
}

auto Uuid::is_nil() const -> bool {
  return std::all_of(bytes_.begin(), bytes_.end(),
                     [](std::uint8_t byte) { return byte == 0; });
}

}  // namespace tuid::core
