#include "codegen/enum_decl.hpp"

#include <string_view>
#include <unordered_set>

#include "codegen/naming.hpp"

namespace tuid::codegen {
namespace {

auto invalid(std::string subject, std::string message) -> CodegenError {
  return make_error(CodegenErrorCode::InvalidInput, std::move(subject), std::move(message));
}

auto is_namespace_path(std::string_view text) -> bool {
  while (true) {
    auto sep = text.find("::");
    const auto segment = text.substr(0, sep);
    if (!is_identifier(segment) || is_keyword(segment)) {
      return false;
    }
    if (sep == std::string_view::npos) {
      return true;
    }
    text.remove_prefix(sep + 2);
  }
}

auto parse_decl_kind(const Json& obj, std::string_view subject) -> Expected<DeclKind> {
  auto it = obj.find("kind");
  if (it == obj.end()) {
    return DeclKind::Enum;
  }
  if (!it->is_string()) {
    return tl::unexpected(invalid(std::string(subject), "kind must be a string"));
  }
  const auto value = it->get<std::string>();
  if (value == "enum") return DeclKind::Enum;
  if (value == "struct") return DeclKind::Struct;
  if (value == "union") return DeclKind::Union;
  return tl::unexpected(invalid(std::string(subject),
                                "kind must be one of 'enum', 'struct', 'union', got '" +
                                    value + "'"));
}

auto parse_variant(const Json& json, std::string_view owner) -> Expected<VariantDecl> {
  VariantDecl variant;
  if (json.is_string()) {
    variant.name = json.get<std::string>();
  } else if (json.is_object()) {
    auto name_it = json.find("name");
    if (name_it == json.end() || !name_it->is_string()) {
      return tl::unexpected(invalid(std::string(owner),
                                    "variant entry: missing or invalid field 'name'"));
    }
    variant.name = name_it->get<std::string>();
    variant.has_fields = json.contains("fields");
    if (auto attrs_it = json.find("attributes"); attrs_it != json.end()) {
      if (!attrs_it->is_object()) {
        return tl::unexpected(invalid(variant.name, "attributes must be an object"));
      }
      for (const auto& item : attrs_it->items()) {
        variant.attributes.emplace_back(item.key(), item.value());
      }
    }
  } else {
    return tl::unexpected(invalid(std::string(owner),
                                  "variant entry must be a string or an object"));
  }

  if (!is_identifier(variant.name)) {
    return tl::unexpected(invalid(std::string(owner),
                                  "variant name '" + variant.name +
                                      "' is not a valid identifier"));
  }
  if (is_keyword(variant.name)) {
    return tl::unexpected(invalid(std::string(owner),
                                  "variant name '" + variant.name + "' is a C++ keyword"));
  }
  return variant;
}

}  // namespace

auto EnumDecl::qualified_name() const -> std::string {
  if (ns.empty()) {
    return name;
  }
  return ns + "::" + name;
}

auto parse_enum_decl(const Json& json) -> Expected<EnumDecl> {
  if (!json.is_object()) {
    return tl::unexpected(invalid("", "description must be an object"));
  }

  EnumDecl decl;
  auto name_it = json.find("name");
  if (name_it == json.end() || !name_it->is_string()) {
    return tl::unexpected(invalid("", "description: missing or invalid field 'name'"));
  }
  decl.name = name_it->get<std::string>();
  if (!is_identifier(decl.name)) {
    return tl::unexpected(invalid(decl.name, "name is not a valid identifier"));
  }
  if (is_keyword(decl.name)) {
    return tl::unexpected(invalid(decl.name, "name is a C++ keyword"));
  }

  if (auto ns_it = json.find("namespace"); ns_it != json.end()) {
    if (!ns_it->is_string()) {
      return tl::unexpected(invalid(decl.name, "namespace must be a string"));
    }
    decl.ns = ns_it->get<std::string>();
    if (!decl.ns.empty() && !is_namespace_path(decl.ns)) {
      return tl::unexpected(invalid(decl.name, "namespace '" + decl.ns + "' is not a valid path"));
    }
  }

  auto kind = parse_decl_kind(json, decl.name);
  if (!kind) {
    return tl::unexpected(kind.error());
  }
  decl.kind = *kind;

  auto variants_it = json.find("variants");
  if (variants_it == json.end()) {
    // Records describe their members as `fields`; only enums need variants.
    if (decl.kind == DeclKind::Enum) {
      return tl::unexpected(invalid(decl.name, "variants must be an array"));
    }
    return decl;
  }
  if (!variants_it->is_array()) {
    return tl::unexpected(invalid(decl.name, "variants must be an array"));
  }

  std::unordered_set<std::string> seen;
  for (const auto& variant_json : *variants_it) {
    auto variant = parse_variant(variant_json, decl.name);
    if (!variant) {
      return tl::unexpected(variant.error());
    }
    if (!seen.insert(variant->name).second) {
      return tl::unexpected(invalid(decl.name, "duplicate variant: " + variant->name));
    }
    decl.variants.push_back(std::move(*variant));
  }
  return decl;
}

auto parse_enum_decls(const Json& json) -> Expected<std::vector<EnumDecl>> {
  std::vector<EnumDecl> decls;
  if (json.is_object()) {
    auto decl = parse_enum_decl(json);
    if (!decl) {
      return tl::unexpected(decl.error());
    }
    decls.push_back(std::move(*decl));
    return decls;
  }
  if (!json.is_array()) {
    return tl::unexpected(invalid("", "description file must hold an object or an array"));
  }
  if (json.empty()) {
    return tl::unexpected(invalid("", "description file holds no descriptions"));
  }

  std::unordered_set<std::string> names;
  for (const auto& entry : json) {
    auto decl = parse_enum_decl(entry);
    if (!decl) {
      return tl::unexpected(decl.error());
    }
    if (!names.insert(decl->qualified_name()).second) {
      return tl::unexpected(invalid(decl->qualified_name(), "declared more than once"));
    }
    decls.push_back(std::move(*decl));
  }
  return decls;
}

}  // namespace tuid::codegen
