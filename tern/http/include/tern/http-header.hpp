#pragma once

#include <span>
#include <string>
#include <string_view>

namespace tern::http {

// Non-owning view of a header line. Name keeps its original case.
struct HeaderView {
  std::string_view name;
  std::string_view value;

  bool operator==(const HeaderView&) const noexcept = default;
};

// Ordered request headers, in arrival order with duplicates preserved.
using HeadersView = std::span<const HeaderView>;

// Owning header, used by responses built by handlers.
struct Header {
  std::string name;
  std::string value;

  bool operator==(const Header&) const noexcept = default;
};

constexpr bool IsHeaderWhitespace(char ch) noexcept { return ch == ' ' || ch == '\t'; }

// Field values: visible 7-bit ASCII, SP and HTAB.
constexpr bool IsValidHeaderValueChar(char ch) noexcept {
  const auto uc = static_cast<unsigned char>(ch);
  return uc == '\t' || (uc >= 0x20 && uc <= 0x7E);
}

}  // namespace tern::http
