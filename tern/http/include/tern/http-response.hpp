#pragma once

#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>

#include "tern/http-constants.hpp"
#include "tern/http-header.hpp"
#include "tern/http-status-code.hpp"
#include "tern/vector.hpp"

namespace tern {

// Response built by a handler.
// Date, Server, Content-Length and Connection are owned by the ResponseSerializer: any value set here for them
// is dropped at serialization time (a 'Connection: close' set here still forces the connection to close).
//
// Setters come in lvalue and rvalue flavors so that they can be chained on a temporary:
//   return HttpResponse(http::StatusCodeCreated).header("X-Id", "42").body("created");
class HttpResponse {
 public:
  // Throws std::invalid_argument if code is outside [100, 599].
  explicit HttpResponse(http::StatusCode code = http::StatusCodeOK);

  // 200 response with given body.
  explicit HttpResponse(std::string body, std::string_view contentType = http::ContentTypeTextPlain)
      : HttpResponse() {
    setBody(std::move(body), contentType);
  }

  [[nodiscard]] http::StatusCode status() const noexcept { return _status; }

  // Reason phrase of the status code, empty for non standard codes.
  [[nodiscard]] std::string_view reason() const noexcept { return http::ReasonPhraseFor(_status); }

  // Throws std::invalid_argument if code is outside [100, 599].
  HttpResponse& status(http::StatusCode code) & {
    setStatus(code);
    return *this;
  }

  HttpResponse&& status(http::StatusCode code) && {
    setStatus(code);
    return std::move(*this);
  }

  // Set a header, replacing all previous values of the same name (case-insensitive).
  // Throws std::invalid_argument if name is not a token or if value contains characters that are not allowed
  // in a field value (CR and LF among them).
  HttpResponse& header(std::string_view name, std::string_view value) & {
    setHeader(name, value, true);
    return *this;
  }

  HttpResponse&& header(std::string_view name, std::string_view value) && {
    setHeader(name, value, true);
    return std::move(*this);
  }

  // Append a header line, keeping previous values of the same name.
  // Same validation as header().
  HttpResponse& addHeader(std::string_view name, std::string_view value) & {
    setHeader(name, value, false);
    return *this;
  }

  HttpResponse&& addHeader(std::string_view name, std::string_view value) && {
    setHeader(name, value, false);
    return std::move(*this);
  }

  // First value of the given header, std::nullopt if absent.
  [[nodiscard]] std::optional<std::string_view> headerValue(std::string_view name) const noexcept;

  [[nodiscard]] std::string_view headerValueOrEmpty(std::string_view name) const noexcept {
    return headerValue(name).value_or(std::string_view{});
  }

  [[nodiscard]] std::span<const http::Header> headers() const noexcept { return {_headers.data(), _headers.size()}; }

  [[nodiscard]] std::string_view body() const noexcept { return _body; }

  // Set the body and its Content-Type. An empty contentType leaves the Content-Type header untouched.
  HttpResponse& body(std::string body, std::string_view contentType = http::ContentTypeTextPlain) & {
    setBody(std::move(body), contentType);
    return *this;
  }

  HttpResponse&& body(std::string body, std::string_view contentType = http::ContentTypeTextPlain) && {
    setBody(std::move(body), contentType);
    return std::move(*this);
  }

  bool operator==(const HttpResponse&) const noexcept = default;

 private:
  void setStatus(http::StatusCode code);

  void setHeader(std::string_view name, std::string_view value, bool replace);

  void setBody(std::string body, std::string_view contentType);

  vector<http::Header> _headers;
  std::string _body;
  http::StatusCode _status{http::StatusCodeOK};
};

}  // namespace tern
