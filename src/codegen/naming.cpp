#include "codegen/naming.hpp"

#include <algorithm>
#include <array>
#include <cctype>

namespace tuid::codegen {
namespace {

auto is_upper(char c) -> bool { return std::isupper(static_cast<unsigned char>(c)) != 0; }
auto is_lower(char c) -> bool { return std::islower(static_cast<unsigned char>(c)) != 0; }

// Sorted for binary search.
constexpr std::array<std::string_view, 92> kKeywords = {
    "alignas",      "alignof",     "and",          "and_eq",       "asm",
    "auto",         "bitand",      "bitor",        "bool",         "break",
    "case",         "catch",       "char",         "char16_t",     "char32_t",
    "char8_t",      "class",       "co_await",     "co_return",    "co_yield",
    "compl",        "concept",     "const",        "const_cast",   "consteval",
    "constexpr",    "constinit",   "continue",     "decltype",     "default",
    "delete",       "do",          "double",       "dynamic_cast", "else",
    "enum",         "explicit",    "export",       "extern",       "false",
    "float",        "for",         "friend",       "goto",         "if",
    "inline",       "int",         "long",         "mutable",      "namespace",
    "new",          "noexcept",    "not",          "not_eq",       "nullptr",
    "operator",     "or",          "or_eq",        "private",      "protected",
    "public",       "register",    "reinterpret_cast", "requires", "return",
    "short",        "signed",      "sizeof",       "static",       "static_assert",
    "static_cast",  "struct",      "switch",       "template",     "this",
    "thread_local", "throw",       "true",         "try",          "typedef",
    "typeid",       "typename",    "union",        "unsigned",     "using",
    "virtual",      "void",        "volatile",     "wchar_t",      "while",
    "xor",          "xor_eq",
};

static_assert(std::is_sorted(kKeywords.begin(), kKeywords.end()));

}  // namespace

auto to_snake_case(std::string_view identifier) -> std::string {
  std::string out;
  out.reserve(identifier.size() + identifier.size() / 2);

  for (std::size_t i = 0; i < identifier.size(); ++i) {
    const char c = identifier[i];
    if (!is_upper(c)) {
      out.push_back(c);
      continue;
    }
    if (i > 0) {
      const bool prev_lower = is_lower(identifier[i - 1]);
      const bool next_lower = i + 1 < identifier.size() && is_lower(identifier[i + 1]);
      if ((prev_lower || next_lower) && out.back() != '_') {
        out.push_back('_');
      }
    }
    out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  return out;
}

auto is_identifier(std::string_view text) -> bool {
  if (text.empty()) {
    return false;
  }
  const auto first = static_cast<unsigned char>(text.front());
  if (!std::isalpha(first) && first != '_') {
    return false;
  }
  for (char c : text.substr(1)) {
    const auto u = static_cast<unsigned char>(c);
    if (!std::isalnum(u) && u != '_') {
      return false;
    }
  }
  return true;
}

auto is_keyword(std::string_view text) -> bool {
  return std::binary_search(kKeywords.begin(), kKeywords.end(), text);
}

}  // namespace tuid::codegen
