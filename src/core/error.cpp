#include "core/error.hpp"

namespace tuid::core {

auto to_string(IdErrorCode code) -> std::string_view {
  switch (code) {
    case IdErrorCode::UnknownTag:
      return "unknown_tag";
    case IdErrorCode::InvalidFormat:
      return "invalid_format";
    case IdErrorCode::InvalidUuid:
      return "invalid_uuid";
    case IdErrorCode::PrefixMismatch:
      return "prefix_mismatch";
    case IdErrorCode::InvalidDescriptor:
      return "invalid_descriptor";
  }
  return "unknown";
}

}  // namespace tuid::core
