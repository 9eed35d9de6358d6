#pragma once

#include <string>
#include <string_view>

namespace tern::url {

// Decodes percent-encoded sequences within [first, last), compacting in place.
// '+' is kept as is (path semantics).
// Returns nullptr on invalid encoding (truncated % or non-hex digits) leaving the buffer in an unspecified partially
// modified state (caller can decide to discard it).
// Returns a pointer to the new logical end of the decoded sequence.
char* DecodeInPlace(char* first, char* last);

// Convenience wrapper appending the decoded form of 'encoded' to 'out'.
// Returns false (and leaves 'out' unspecified) on invalid encoding.
bool DecodeAppend(std::string_view encoded, std::string& out);

}  // namespace tern::url
