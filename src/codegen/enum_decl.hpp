#pragma once

#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "codegen/error.hpp"

namespace tuid::codegen {

using Json = nlohmann::json;

/// What kind of C++ type the description declares.
enum class DeclKind {
  Enum,
  Struct,
  Union,
};

struct VariantDecl {
  std::string name;
  /// Set when the description attaches data (`fields`) to the variant.
  bool has_fields = false;
  /// Attribute key/value pairs in description order.
  std::vector<std::pair<std::string, Json>> attributes;
};

/// The declared shape of one kind enumeration.
struct EnumDecl {
  DeclKind kind = DeclKind::Enum;
  std::string name;
  /// Enclosing C++ namespace, `a::b` form; empty for the global namespace.
  std::string ns;
  std::vector<VariantDecl> variants;

  auto qualified_name() const -> std::string;
};

/// Parse one description object.
auto parse_enum_decl(const Json& json) -> Expected<EnumDecl>;

/// Parse a description file: a single object or an array of objects.
auto parse_enum_decls(const Json& json) -> Expected<std::vector<EnumDecl>>;

}  // namespace tuid::codegen
