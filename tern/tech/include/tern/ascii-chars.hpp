#pragma once

#include <array>
#include <cstdint>
#include <string_view>

namespace tern {

namespace detail {

enum : uint8_t { kTokenChar = 1U << 0, kHexDigit = 1U << 1, kOwsChar = 1U << 2 };

consteval std::array<uint8_t, 256> MakeAsciiClassTable() {
  std::array<uint8_t, 256> table{};
  for (unsigned ch = '0'; ch <= '9'; ++ch) {
    table[ch] |= kTokenChar | kHexDigit;
  }
  for (unsigned ch = 'a'; ch <= 'z'; ++ch) {
    table[ch] |= kTokenChar;
    table[ch - 'a' + 'A'] |= kTokenChar;
  }
  for (unsigned ch = 'a'; ch <= 'f'; ++ch) {
    table[ch] |= kHexDigit;
    table[ch - 'a' + 'A'] |= kHexDigit;
  }
  for (char ch : std::string_view("!#$%&'*+-.^_`|~")) {
    table[static_cast<unsigned char>(ch)] |= kTokenChar;
  }
  table[static_cast<unsigned char>(' ')] |= kOwsChar;
  table[static_cast<unsigned char>('\t')] |= kOwsChar;
  return table;
}

inline constexpr std::array<uint8_t, 256> kAsciiClasses = MakeAsciiClassTable();

}  // namespace detail

// tchar of RFC 9110 5.6.2, the characters allowed in methods and field names.
constexpr bool IsTokenChar(char ch) noexcept {
  return (detail::kAsciiClasses[static_cast<unsigned char>(ch)] & detail::kTokenChar) != 0;
}

constexpr bool IsToken(std::string_view str) noexcept {
  if (str.empty()) {
    return false;
  }
  for (char ch : str) {
    if (!IsTokenChar(ch)) {
      return false;
    }
  }
  return true;
}

// Optional whitespace: SP and HTAB only.
constexpr bool IsOwsChar(char ch) noexcept {
  return (detail::kAsciiClasses[static_cast<unsigned char>(ch)] & detail::kOwsChar) != 0;
}

// Value of a hexadecimal digit, or -1.
constexpr int HexDigitValue(char ch) noexcept {
  if ((detail::kAsciiClasses[static_cast<unsigned char>(ch)] & detail::kHexDigit) == 0) {
    return -1;
  }
  if (ch <= '9') {
    return ch - '0';
  }
  return (ch | 0x20) - 'a' + 10;
}

constexpr char ToLowerAscii(char ch) noexcept { return ch >= 'A' && ch <= 'Z' ? static_cast<char>(ch | 0x20) : ch; }

constexpr std::string_view TrimOws(std::string_view sv) noexcept {
  while (!sv.empty() && IsOwsChar(sv.front())) {
    sv.remove_prefix(1);
  }
  while (!sv.empty() && IsOwsChar(sv.back())) {
    sv.remove_suffix(1);
  }
  return sv;
}

}  // namespace tern
