#pragma once

#include <cstddef>
#include <string_view>

namespace tern {

// Writes exactly NbDigits decimal digits of value, zero padded on the left, and returns the position past the last
// written char. value is expected to be non negative and to fit.
template <std::size_t NbDigits>
constexpr auto WriteFixedDigits(auto out, auto value) {
  static_assert(NbDigits > 0);
  for (std::size_t pos = NbDigits; pos != 0; --pos) {
    out[pos - 1] = static_cast<char>('0' + (value % 10));
    value /= 10;
  }
  return out + NbDigits;
}

constexpr auto CopyChars(auto out, std::string_view chars) {
  for (char ch : chars) {
    *out = ch;
    ++out;
  }
  return out;
}

}  // namespace tern
