#pragma once

#include <string>
#include <string_view>
#include <utility>

#include <tl/expected.hpp>

namespace tuid::codegen {

/// Build-time failures. Each one stops generation for the whole input.
enum class CodegenErrorCode {
  InvalidInput,
  NotEnum,
  EmptyEnum,
  NonUnitVariant,
  TooManyVariants,
  UnknownAttributeKey,
  InvalidAttributeValue,
};

struct CodegenError {
  CodegenErrorCode code = CodegenErrorCode::InvalidInput;
  /// Enum or variant the diagnostic points at (may be empty).
  std::string subject;
  std::string message;
};

template <typename T>
using Expected = tl::expected<T, CodegenError>;

inline auto make_error(CodegenErrorCode code, std::string subject, std::string message)
    -> CodegenError {
  return CodegenError{code, std::move(subject), std::move(message)};
}

auto to_string(CodegenErrorCode code) -> std::string_view;

/// `error[<code>]: <subject>: <message>`, the form printed by `tuid_gen`.
auto format_diagnostic(const CodegenError& error) -> std::string;

}  // namespace tuid::codegen
