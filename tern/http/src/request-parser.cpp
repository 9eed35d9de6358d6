#include "tern/request-parser.hpp"

#include <algorithm>
#include <charconv>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <string_view>
#include <system_error>

#include "tern/ascii-chars.hpp"
#include "tern/error-kind.hpp"
#include "tern/http-constants.hpp"
#include "tern/http-header.hpp"
#include "tern/http-method.hpp"
#include "tern/http-request.hpp"
#include "tern/string-equal-ignore-case.hpp"
#include "tern/url-decode.hpp"

namespace tern {

namespace {

constexpr bool IsDigit(char ch) noexcept { return ch >= '0' && ch <= '9'; }

// request-target characters: visible US-ASCII only, no SP nor control characters.
constexpr bool IsValidTargetChar(char ch) noexcept {
  const auto uc = static_cast<unsigned char>(ch);
  return uc >= 0x21 && uc <= 0x7E;
}

// HTTP-version = "HTTP/" DIGIT "." DIGIT
constexpr bool IsHttpVersionSyntax(std::string_view version) noexcept {
  return version.size() == http::HTTP11Sv.size() && version.starts_with("HTTP/") && IsDigit(version[5]) &&
         version[6] == '.' && IsDigit(version[7]);
}

// Every CR must be followed by LF and every LF preceded by CR.
constexpr bool HasOnlyCrlfLineEndings(std::string_view data) noexcept {
  for (std::size_t pos = 0; pos < data.size(); ++pos) {
    if (data[pos] == '\r') {
      if (pos + 1 == data.size() || data[pos + 1] != '\n') {
        return false;
      }
    } else if (data[pos] == '\n') {
      if (pos == 0 || data[pos - 1] != '\r') {
        return false;
      }
    }
  }
  return true;
}

}  // namespace

HeadScan RequestParser::scanHead(std::string_view buffer, std::size_t scannedBytes) const noexcept {
  HeadScan scan;
  if (buffer.empty()) {
    return scan;
  }
  // Leading empty lines before the request line are not tolerated.
  if (buffer.front() == '\r' || buffer.front() == '\n') {
    scan.status = HeadScan::Status::Error;
    scan.error = http::ErrorKind::Malformed;
    return scan;
  }

  const std::size_t limit = std::min(buffer.size(), _limits.maxHeaderBytes);

  // Restart one byte before the previous end so that a CR received last is checked against its successor.
  for (std::size_t pos = scannedBytes == 0 ? 0 : scannedBytes - 1; pos < limit; ++pos) {
    const char ch = buffer[pos];
    if (ch == '\n') {
      if (pos == 0 || buffer[pos - 1] != '\r') {
        scan.status = HeadScan::Status::Error;
        scan.error = http::ErrorKind::Malformed;
        return scan;
      }
      if (pos >= 3 && buffer[pos - 2] == '\n' && buffer[pos - 3] == '\r') {
        scan.status = HeadScan::Status::Complete;
        scan.headLength = pos + 1;
        return scan;
      }
    } else if (ch == '\r' && pos + 1 < buffer.size() && buffer[pos + 1] != '\n') {
      scan.status = HeadScan::Status::Error;
      scan.error = http::ErrorKind::Malformed;
      return scan;
    }
  }

  if (buffer.size() >= _limits.maxHeaderBytes) {
    scan.status = HeadScan::Status::Error;
    scan.error = http::ErrorKind::HeadTooLarge;
  }
  return scan;
}

http::ErrorKind RequestParser::parseHead(std::string_view head, HttpRequest& request) const {
  request.clear();
  request._head.assign(head.begin(), head.end());

  const std::string_view data(request._head.data(), request._head.size());
  if (!HasOnlyCrlfLineEndings(data) || !data.ends_with(http::DoubleCRLF)) {
    return http::ErrorKind::Malformed;
  }

  const std::size_t requestLineEnd = data.find(http::CRLF);
  bool unknownMethod = false;
  http::ErrorKind err = parseRequestLine(data.substr(0, requestLineEnd), request, unknownMethod);
  if (err != http::ErrorKind::None) {
    return err;
  }

  // Header lines, each terminated by CRLF, without the final empty line.
  const std::size_t headersBeg = requestLineEnd + http::CRLF.size();
  if (headersBeg < data.size()) {
    err = parseHeaderLines(data.substr(headersBeg, data.size() - headersBeg - http::CRLF.size()), request);
    if (err != http::ErrorKind::None) {
      return err;
    }
  }

  if (request.headerValue(http::TransferEncoding)) {
    return http::ErrorKind::TransferEncodingUnsupported;
  }

  std::optional<std::size_t> contentLength;
  uint32_t nbHost = 0;
  for (const http::HeaderView& header : request._headers) {
    if (CaseInsensitiveEqual(header.name, http::ContentLength)) {
      const std::string_view value = header.value;
      if (value.empty() || !std::ranges::all_of(value, IsDigit)) {
        return http::ErrorKind::Malformed;
      }
      std::size_t len;
      const auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), len);
      if (ec == std::errc::result_out_of_range) {
        // Saturated, so that the body cap check rejects it.
        len = std::numeric_limits<std::size_t>::max();
      } else if (ec != std::errc{} || ptr != value.data() + value.size()) {
        return http::ErrorKind::Malformed;
      }
      // Identical repetitions are tolerated, differing ones are a framing ambiguity.
      if (contentLength && *contentLength != len) {
        return http::ErrorKind::Malformed;
      }
      contentLength = len;
    } else if (CaseInsensitiveEqual(header.name, http::Host)) {
      ++nbHost;
    } else if (CaseInsensitiveEqual(header.name, http::Connection) &&
               ContainsTokenIgnoreCase(header.value, http::close)) {
      request._keepAlive = false;
    }
  }
  request._contentLength = contentLength.value_or(0);

  if (nbHost == 0) {
    return http::ErrorKind::MissingHost;
  }
  if (nbHost > 1) {
    return http::ErrorKind::Malformed;
  }
  if (unknownMethod) {
    return http::ErrorKind::UnknownMethod;
  }
  return http::ErrorKind::None;
}

http::ErrorKind RequestParser::parseRequestLine(std::string_view line, HttpRequest& request,
                                                bool& unknownMethod) const {
  const std::size_t firstSp = line.find(' ');
  if (firstSp == std::string_view::npos) {
    return http::ErrorKind::Malformed;
  }
  const std::string_view methodStr = line.substr(0, firstSp);
  if (!IsToken(methodStr)) {
    return http::ErrorKind::Malformed;
  }

  line.remove_prefix(firstSp + 1);
  const std::size_t secondSp = line.find(' ');
  if (secondSp == std::string_view::npos) {
    return http::ErrorKind::Malformed;
  }
  const std::string_view target = line.substr(0, secondSp);
  const std::string_view version = line.substr(secondSp + 1);

  // Any extra SP ends up either in an empty target or in the version.
  if (target.empty() || !std::ranges::all_of(target, IsValidTargetChar) || !IsHttpVersionSyntax(version)) {
    return http::ErrorKind::Malformed;
  }
  if (version != http::HTTP11Sv) {
    return http::ErrorKind::UnsupportedVersion;
  }

  const auto optMethod = http::MethodStrToOptEnum(methodStr);
  unknownMethod = !optMethod;
  if (optMethod) {
    request._method = *optMethod;
  }

  if (target == "*") {
    if (methodStr != http::MethodToStr(http::Method::OPTIONS)) {
      return http::ErrorKind::Malformed;
    }
  } else if (target.front() != '/') {
    // absolute-form and authority-form are not served.
    return http::ErrorKind::Malformed;
  }

  const std::size_t queryPos = target.find('?');
  const std::string_view path = target.substr(0, queryPos);
  const std::string_view query = queryPos == std::string_view::npos ? std::string_view{} : target.substr(queryPos + 1);
  if (path.size() > _limits.maxPathBytes || query.size() > _limits.maxQueryBytes) {
    return http::ErrorKind::UriTooLong;
  }
  if (!url::DecodeAppend(path, request._decodedPath)) {
    return http::ErrorKind::Malformed;
  }

  request._methodStr = methodStr;
  request._target = target;
  request._path = path;
  request._query = query;
  return http::ErrorKind::None;
}

http::ErrorKind RequestParser::parseHeaderLines(std::string_view lines, HttpRequest& request) const {
  uint32_t nbHeaders = 0;
  while (!lines.empty()) {
    const std::size_t lineEnd = lines.find(http::CRLF);
    const std::string_view line = lines.substr(0, lineEnd);
    lines.remove_prefix(lineEnd == std::string_view::npos ? lines.size() : lineEnd + http::CRLF.size());

    if (++nbHeaders > _limits.maxHeaderCount) {
      return http::ErrorKind::HeadTooLarge;
    }
    // A line starting with whitespace is an obsolete line folding.
    if (line.empty() || http::IsHeaderWhitespace(line.front())) {
      return http::ErrorKind::Malformed;
    }
    const std::size_t colonPos = line.find(':');
    if (colonPos == std::string_view::npos) {
      return http::ErrorKind::Malformed;
    }
    const std::string_view name = line.substr(0, colonPos);
    if (!IsToken(name)) {
      return http::ErrorKind::Malformed;
    }
    const std::string_view value = TrimOws(line.substr(colonPos + 1));
    if (!std::ranges::all_of(value, http::IsValidHeaderValueChar)) {
      return http::ErrorKind::Malformed;
    }
    request._headers.push_back(http::HeaderView{name, value});
  }
  return http::ErrorKind::None;
}

}  // namespace tern
