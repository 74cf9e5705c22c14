#pragma once

#include <span>
#include <string>

#include "codegen/validate.hpp"

namespace tuid::codegen {

struct EmitOptions {
  /// Description file the header was generated from (banner only).
  std::string source_name;
  /// Include path of the KindTraits declaration.
  std::string kind_header = "core/kind.hpp";
};

/// Render a self-contained header declaring each enumeration and its
/// `tuid::core::KindTraits` specialisation. Output is deterministic.
auto emit_header(std::span<const KindTable> tables, const EmitOptions& options) -> std::string;

}  // namespace tuid::codegen
