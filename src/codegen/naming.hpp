#pragma once

#include <string>
#include <string_view>

namespace tuid::codegen {

/// Derive the default kind name from a variant identifier.
///
/// Splits before an uppercase letter that follows a lowercase letter, and
/// before the last letter of an uppercase run that is followed by a lowercase
/// letter; digits stay with the token they trail. Tokens are lowercased and
/// joined with '_':
///
///   Retail     -> retail
///   HTTPServer -> http_server
///   UserID     -> user_id
auto to_snake_case(std::string_view identifier) -> std::string;

/// True for `[A-Za-z_][A-Za-z0-9_]*`.
auto is_identifier(std::string_view text) -> bool;

/// True for C++20 keywords and alternative operator tokens, which cannot name
/// an enum, enumerator or namespace in the emitted header.
auto is_keyword(std::string_view text) -> bool;

}  // namespace tuid::codegen
