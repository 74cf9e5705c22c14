#pragma once

#include <string>
#include <string_view>
#include <utility>

#include <tl/expected.hpp>

namespace tuid::core {

enum class IdErrorCode {
  UnknownTag,
  InvalidFormat,
  InvalidUuid,
  PrefixMismatch,
  InvalidDescriptor,
};

struct IdError {
  IdErrorCode code = IdErrorCode::InvalidFormat;
  std::string message;
};

template <typename T>
using Expected = tl::expected<T, IdError>;

inline auto make_error(IdErrorCode code, std::string message) -> IdError {
  return IdError{code, std::move(message)};
}

/// Stable snake_case spelling of an error code (used in logs and diagnostics).
auto to_string(IdErrorCode code) -> std::string_view;

}  // namespace tuid::core
