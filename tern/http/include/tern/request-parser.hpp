#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

#include "tern/error-kind.hpp"

namespace tern {

class HttpRequest;

// Size caps enforced while framing and parsing a request head.
struct ParserLimits {
  // Whole head, request line and final CRLFCRLF included.
  std::size_t maxHeaderBytes{32UL * 1024UL};
  uint32_t maxHeaderCount{100};
  std::size_t maxPathBytes{8UL * 1024UL};
  std::size_t maxQueryBytes{8UL * 1024UL};
};

// Result of the search for the end of a request head in a partially received buffer.
struct HeadScan {
  enum class Status : uint8_t { NeedMore, Complete, Error };

  Status status{Status::NeedMore};
  // Length of the head including the final CRLFCRLF, when Complete.
  std::size_t headLength{};
  // Failure kind, when Error.
  http::ErrorKind error{http::ErrorKind::None};
};

// Stateless HTTP/1.1 request head parser.
//
// Grammar:
//   request-line = method SP request-target SP HTTP-version CRLF
//   header-field = field-name ":" OWS field-value OWS CRLF
// Only CRLF line endings are accepted, obsolete line folding is rejected and the target must be in origin-form
// (or '*' for OPTIONS).
class RequestParser {
 public:
  RequestParser() noexcept = default;

  explicit RequestParser(const ParserLimits& limits) noexcept : _limits(limits) {}

  // Look for the end of the head in 'buffer'. Bytes before 'scannedBytes' were already examined by a previous
  // call on the same (grown) buffer and are not scanned again.
  // Reports Malformed as early as possible for leading empty lines and bare CR or LF, and HeadTooLarge as soon as
  // maxHeaderBytes bytes were received without a complete head.
  [[nodiscard]] HeadScan scanHead(std::string_view buffer, std::size_t scannedBytes = 0) const noexcept;

  // Parse a complete head (as delimited by scanHead) into 'request', which takes a copy of the head bytes.
  // Returns ErrorKind::None on success. On ErrorKind::UnknownMethod, 'request' is fully parsed (its body framing
  // is known) but its method() is not meaningful.
  // When several problems are present, the reported kind follows this precedence:
  //   Malformed request line > UnsupportedVersion > UriTooLong > header grammar (Malformed) / HeadTooLarge
  //   > TransferEncodingUnsupported > bad Content-Length (Malformed) > Host problems > UnknownMethod
  [[nodiscard]] http::ErrorKind parseHead(std::string_view head, HttpRequest& request) const;

  [[nodiscard]] const ParserLimits& limits() const noexcept { return _limits; }

 private:
  http::ErrorKind parseRequestLine(std::string_view line, HttpRequest& request, bool& unknownMethod) const;

  http::ErrorKind parseHeaderLines(std::string_view lines, HttpRequest& request) const;

  ParserLimits _limits;
};

}  // namespace tern
