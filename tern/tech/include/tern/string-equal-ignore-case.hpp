#pragma once

#include <string_view>

#include "tern/ascii-chars.hpp"

namespace tern {

constexpr bool CaseInsensitiveEqual(std::string_view lhs, std::string_view rhs) {
  if (lhs.size() != rhs.size()) {
    return false;
  }

  const char* pLhs = lhs.data();
  const char* pRhs = rhs.data();
  const char* end = pLhs + lhs.size();

  for (; pLhs != end; ++pLhs, ++pRhs) {
    if (ToLowerAscii(*pLhs) != ToLowerAscii(*pRhs)) {
      return false;
    }
  }
  return true;
}

// Returns true if the comma separated token list 'value' contains 'token' (case-insensitive, OWS trimmed).
// Example: ContainsTokenIgnoreCase("keep-alive, Close", "close") -> true
constexpr bool ContainsTokenIgnoreCase(std::string_view value, std::string_view token) {
  while (!value.empty()) {
    const auto commaPos = value.find(',');
    if (CaseInsensitiveEqual(TrimOws(value.substr(0, commaPos)), token)) {
      return true;
    }
    if (commaPos == std::string_view::npos) {
      break;
    }
    value.remove_prefix(commaPos + 1);
  }
  return false;
}

}  // namespace tern
