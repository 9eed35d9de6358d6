#pragma once

#include <cstddef>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>

#include "tern/http-header.hpp"
#include "tern/http-method.hpp"
#include "tern/vector.hpp"

namespace tern {

class RequestParser;
class WireReader;

namespace internal {
class Connection;
}  // namespace internal

// A fully framed HTTP/1.1 request.
// The request owns a copy of its head bytes: all string_view accessors point into it and stay valid for the
// lifetime of the HttpRequest object. The body is stored separately.
class HttpRequest {
 public:
  HttpRequest() noexcept = default;

  HttpRequest(const HttpRequest&) = delete;
  HttpRequest(HttpRequest&&) noexcept = default;
  HttpRequest& operator=(const HttpRequest&) = delete;
  HttpRequest& operator=(HttpRequest&&) noexcept = default;

  ~HttpRequest() = default;

  // The method of the request (GET, PUT, ...). Only meaningful for requests that reached a handler.
  [[nodiscard]] http::Method method() const noexcept { return _method; }

  // The method token exactly as received on the request line.
  [[nodiscard]] std::string_view methodStr() const noexcept { return _methodStr; }

  // The raw request target, path and query included.
  [[nodiscard]] std::string_view target() const noexcept { return _target; }

  // The raw path (not percent-decoded), without the query string.
  // Example:
  //  GET /path%2Caaa?key=val -> '/path%2Caaa'
  [[nodiscard]] std::string_view path() const noexcept { return _path; }

  // The raw query string, without the leading '?'. Empty if absent.
  [[nodiscard]] std::string_view query() const noexcept { return _query; }

  // The percent-decoded path ('+' is kept as is).
  //  GET /path%2Caaa?key=val -> '/path,aaa'
  [[nodiscard]] std::string_view decodedPath() const noexcept { return _decodedPath; }

  // All header lines in arrival order. Names keep their original case, values are trimmed of surrounding OWS.
  [[nodiscard]] http::HeadersView headers() const noexcept { return {_headers.data(), _headers.size()}; }

  // First value of the given header (case-insensitive lookup), std::nullopt if absent.
  [[nodiscard]] std::optional<std::string_view> headerValue(std::string_view name) const noexcept;

  // Like headerValue() but returns an empty string_view when the header is absent.
  [[nodiscard]] std::string_view headerValueOrEmpty(std::string_view name) const noexcept {
    return headerValue(name).value_or(std::string_view{});
  }

  // All values of the given header, in arrival order.
  [[nodiscard]] vector<std::string_view> headerValues(std::string_view name) const;

  [[nodiscard]] std::string_view body() const noexcept { return _body; }

  // Declared Content-Length, 0 when absent.
  [[nodiscard]] std::size_t contentLength() const noexcept { return _contentLength; }

  // false if the client sent 'Connection: close'.
  [[nodiscard]] bool keepAlive() const noexcept { return _keepAlive; }

  // Remote address of the client as "ip:port".
  [[nodiscard]] std::string_view peer() const noexcept { return _peer; }

  // Server cancellation token. Requested once the shutdown grace period is over; long running handlers
  // may poll it to return early.
  [[nodiscard]] std::stop_token stopToken() const noexcept { return _stopToken; }

 private:
  friend class RequestParser;
  friend class WireReader;
  friend class internal::Connection;

  void clear();

  vector<char> _head;
  vector<http::HeaderView> _headers;
  std::string _decodedPath;
  std::string _body;
  std::string _peer;
  std::stop_token _stopToken;
  std::string_view _methodStr;
  std::string_view _target;
  std::string_view _path;
  std::string_view _query;
  std::size_t _contentLength{};
  http::Method _method{http::Method::GET};
  bool _keepAlive{true};
};

}  // namespace tern
