#include "codegen/emit.hpp"

#include <format>
#include <iterator>

#include "common/logging/log.hpp"

namespace tuid::codegen {
namespace {

auto escape_literal(std::string_view text) -> std::string {
  std::string out;
  out.reserve(text.size());
  for (char c : text) {
    switch (c) {
      case '"':
        out += "\\\"";
        break;
      case '\\':
        out += "\\\\";
        break;
      case '\n':
        out += "\\n";
        break;
      default:
        // Three-digit octal so a following digit is never absorbed.
        if (const auto u = static_cast<unsigned char>(c); u < 0x20 || u == 0x7F) {
          std::format_to(std::back_inserter(out), "\\{:03o}", u);
        } else {
          out.push_back(c);
        }
    }
  }
  return out;
}

auto emit_enum(std::string& out, const KindTable& table) -> void {
  auto it = std::back_inserter(out);
  if (!table.ns.empty()) {
    std::format_to(it, "namespace {} {{\n\n", table.ns);
  }
  std::format_to(it, "enum class {} : std::uint8_t {{\n", table.enum_name);
  for (const auto& entry : table.entries) {
    std::format_to(it, "  {} = {},\n", entry.variant, entry.tag);
  }
  out += "};\n";
  if (!table.ns.empty()) {
    std::format_to(it, "\n}}  // namespace {}\n", table.ns);
  }
  out += "\n";
}

auto emit_traits(std::string& out, const KindTable& table) -> void {
  auto it = std::back_inserter(out);
  const auto type = table.qualified_name();

  std::format_to(it, "template <>\nstruct tuid::core::KindTraits<{}> {{\n", type);
  std::format_to(it, "  static constexpr std::string_view type_name = \"{}\";\n", type);
  std::format_to(it, "  static constexpr std::size_t count = {};\n\n", table.entries.size());

  std::format_to(it, "  static constexpr std::array<{}, count> kinds{{\n", type);
  for (const auto& entry : table.entries) {
    std::format_to(it, "      {}::{},\n", type, entry.variant);
  }
  out += "  };\n\n";

  out += "  static constexpr std::array<std::string_view, count> names{\n";
  for (const auto& entry : table.entries) {
    std::format_to(it, "      \"{}\",\n", escape_literal(entry.name));
  }
  out += "  };\n\n";

  std::format_to(it,
                 "  static constexpr auto tag({} kind) noexcept -> std::uint8_t {{\n"
                 "    return static_cast<std::uint8_t>(kind);\n"
                 "  }}\n\n",
                 type);
  std::format_to(it,
                 "  static constexpr auto from_tag(std::uint8_t tag) noexcept\n"
                 "      -> std::optional<{}> {{\n"
                 "    if (static_cast<std::size_t>(tag) >= count) {{\n"
                 "      return std::nullopt;\n"
                 "    }}\n"
                 "    return kinds[tag];\n"
                 "  }}\n\n",
                 type);
  std::format_to(it,
                 "  static constexpr auto name({} kind) noexcept -> std::string_view {{\n"
                 "    const auto index = static_cast<std::size_t>(tag(kind));\n"
                 "    return index < count ? names[index] : std::string_view{{}};\n"
                 "  }}\n",
                 type);
  out += "};\n\n";
  std::format_to(it, "static_assert(tuid::core::KindDescriptor<{}>);\n\n", type);
}

}  // namespace

auto emit_header(std::span<const KindTable> tables, const EmitOptions& options) -> std::string {
  std::string out;
  auto it = std::back_inserter(out);

  if (options.source_name.empty()) {
    out += "// Generated by tuid_gen. Do not edit.\n";
  } else {
    std::format_to(it, "// Generated by tuid_gen from {}. Do not edit.\n", options.source_name);
  }
  out += "#pragma once\n\n";
  out += "#include <array>\n#include <cstddef>\n#include <cstdint>\n";
  out += "#include <optional>\n#include <string_view>\n\n";
  std::format_to(it, "#include \"{}\"\n\n", options.kind_header);

  for (const auto& table : tables) {
    emit_enum(out, table);
    emit_traits(out, table);
  }

  tuid::log::debug("emitted {} bytes for {} kind table(s)", out.size(), tables.size());
  return out;
}

}  // namespace tuid::codegen
