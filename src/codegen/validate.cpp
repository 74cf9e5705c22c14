#include "codegen/validate.hpp"

#include <algorithm>
#include <format>
#include <unordered_map>

#include "codegen/naming.hpp"
#include "common/logging/log.hpp"

namespace tuid::codegen {

auto KindTable::qualified_name() const -> std::string {
  if (ns.empty()) {
    return enum_name;
  }
  return ns + "::" + enum_name;
}

auto resolve_name_override(const VariantDecl& variant)
    -> Expected<std::optional<std::string>> {
  std::optional<std::string> name;
  for (const auto& [key, value] : variant.attributes) {
    if (key != kPrefixAttribute) {
      return tl::unexpected(make_error(
          CodegenErrorCode::UnknownAttributeKey, variant.name,
          std::format("unknown kind attribute `{}`. Expected `prefix = \"...\"`", key)));
    }
    if (!value.is_string() || value.get<std::string>().empty()) {
      return tl::unexpected(make_error(
          CodegenErrorCode::InvalidAttributeValue, variant.name,
          "kind attribute `prefix` expects a non-empty string"));
    }
    auto text = value.get<std::string>();
    const bool has_control = std::any_of(text.begin(), text.end(), [](char c) {
      const auto u = static_cast<unsigned char>(c);
      return u < 0x20 || u == 0x7F;
    });
    if (has_control) {
      return tl::unexpected(make_error(
          CodegenErrorCode::InvalidAttributeValue, variant.name,
          "kind attribute `prefix` must not contain control characters"));
    }
    name = std::move(text);
  }
  return name;
}

auto derive_kind_table(const EnumDecl& decl) -> Expected<KindTable> {
  const auto subject = decl.qualified_name();

  if (decl.kind != DeclKind::Enum) {
    return tl::unexpected(make_error(CodegenErrorCode::NotEnum, subject,
                                     "KindDescriptor can only be derived for enums"));
  }

  if (decl.variants.empty()) {
    return tl::unexpected(make_error(
        CodegenErrorCode::EmptyEnum, subject,
        "KindDescriptor cannot be derived for empty enums (at least one variant required)"));
  }

  for (const auto& variant : decl.variants) {
    if (variant.has_fields) {
      return tl::unexpected(make_error(
          CodegenErrorCode::NonUnitVariant, subject + "::" + variant.name,
          "KindDescriptor can only be derived for enums with unit variants (no fields)"));
    }
  }

  if (decl.variants.size() > kMaxVariants) {
    return tl::unexpected(make_error(
        CodegenErrorCode::TooManyVariants, subject,
        std::format("KindDescriptor can only be derived for enums with at most {} variants",
                    kMaxVariants)));
  }

  KindTable table;
  table.enum_name = decl.name;
  table.ns = decl.ns;
  table.entries.reserve(decl.variants.size());

  for (std::size_t index = 0; index < decl.variants.size(); ++index) {
    const auto& variant = decl.variants[index];
    auto custom = resolve_name_override(variant);
    if (!custom) {
      auto error = custom.error();
      error.subject = subject + "::" + error.subject;
      return tl::unexpected(std::move(error));
    }

    KindEntry entry;
    entry.variant = variant.name;
    entry.tag = static_cast<std::uint8_t>(index);
    entry.overridden = custom->has_value();
    entry.name = entry.overridden ? std::move(**custom) : to_snake_case(variant.name);
    table.entries.push_back(std::move(entry));
  }

  // Duplicate names are allowed; warn about them.
  std::unordered_map<std::string, const KindEntry*> by_name;
  for (const auto& entry : table.entries) {
    auto [it, inserted] = by_name.emplace(entry.name, &entry);
    if (!inserted) {
      tuid::log::warn("{}: variants {} and {} share the name '{}'", subject,
                      it->second->variant, entry.variant, entry.name);
    }
  }

  tuid::log::debug("derived kind table for {} with {} entries", subject,
                   table.entries.size());
  return table;
}

}  // namespace tuid::codegen
