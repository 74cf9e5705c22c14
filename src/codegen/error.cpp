#include "codegen/error.hpp"

#include <format>

namespace tuid::codegen {

auto to_string(CodegenErrorCode code) -> std::string_view {
  switch (code) {
    case CodegenErrorCode::InvalidInput:
      return "invalid_input";
    case CodegenErrorCode::NotEnum:
      return "not_enum";
    case CodegenErrorCode::EmptyEnum:
      return "empty_enum";
    case CodegenErrorCode::NonUnitVariant:
      return "non_unit_variant";
    case CodegenErrorCode::TooManyVariants:
      return "too_many_variants";
    case CodegenErrorCode::UnknownAttributeKey:
      return "unknown_attribute_key";
    case CodegenErrorCode::InvalidAttributeValue:
      return "invalid_attribute_value";
  }
  return "unknown";
}

auto format_diagnostic(const CodegenError& error) -> std::string {
  if (error.subject.empty()) {
    return std::format("error[{}]: {}", to_string(error.code), error.message);
  }
  return std::format("error[{}]: {}: {}", to_string(error.code), error.subject,
                     error.message);
}

}  // namespace tuid::codegen
