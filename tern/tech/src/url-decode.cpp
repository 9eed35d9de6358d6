#include "tern/url-decode.hpp"

#include <cstddef>
#include <string>
#include <string_view>

#include "tern/ascii-chars.hpp"

namespace tern::url {

char* DecodeInPlace(char* first, char* last) {
  char* out = first;
  for (; first < last; ++first) {
    const char ch = *first;
    if (ch != '%') {
      *out++ = ch;
      continue;
    }
    if (last - first < 3) {
      return nullptr;
    }
    const int v1 = HexDigitValue(first[1]);
    const int v2 = HexDigitValue(first[2]);
    if (v1 < 0 || v2 < 0) {
      return nullptr;
    }
    *out++ = static_cast<char>((v1 << 4) | v2);
    first += 2;
  }
  return out;
}

bool DecodeAppend(std::string_view encoded, std::string& out) {
  const std::size_t oldSize = out.size();
  out.append(encoded);
  char* begin = out.data() + oldSize;
  char* newEnd = DecodeInPlace(begin, begin + encoded.size());
  if (newEnd == nullptr) {
    return false;
  }
  out.resize(static_cast<std::size_t>(newEnd - out.data()));
  return true;
}

}  // namespace tern::url
