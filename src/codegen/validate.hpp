#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "codegen/enum_decl.hpp"
#include "codegen/error.hpp"

namespace tuid::codegen {

/// Tags are one byte wide.
inline constexpr std::size_t kMaxVariants = 256;

/// The only recognised per-variant attribute: a name override.
inline constexpr std::string_view kPrefixAttribute = "prefix";

struct KindEntry {
  std::string variant;
  std::uint8_t tag = 0;
  std::string name;
  bool overridden = false;
};

/// Everything the emitter needs for one kind enumeration.
struct KindTable {
  std::string enum_name;
  std::string ns;
  std::vector<KindEntry> entries;

  auto qualified_name() const -> std::string;
};

/// Read the name override of a variant, if any.
auto resolve_name_override(const VariantDecl& variant)
    -> Expected<std::optional<std::string>>;

/// Validate the declared shape and assign positional tags and names.
///
/// Checks run in a fixed order and the first failure wins: NotEnum,
/// EmptyEnum, NonUnitVariant, TooManyVariants, then attribute errors.
auto derive_kind_table(const EnumDecl& decl) -> Expected<KindTable>;

}  // namespace tuid::codegen
