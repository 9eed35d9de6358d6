#include "tern/http-request.hpp"

#include <optional>
#include <string_view>

#include "tern/string-equal-ignore-case.hpp"
#include "tern/vector.hpp"

namespace tern {

std::optional<std::string_view> HttpRequest::headerValue(std::string_view name) const noexcept {
  for (const http::HeaderView& header : _headers) {
    if (CaseInsensitiveEqual(header.name, name)) {
      return header.value;
    }
  }
  return std::nullopt;
}

vector<std::string_view> HttpRequest::headerValues(std::string_view name) const {
  vector<std::string_view> values;
  for (const http::HeaderView& header : _headers) {
    if (CaseInsensitiveEqual(header.name, name)) {
      values.push_back(header.value);
    }
  }
  return values;
}

void HttpRequest::clear() {
  _head.clear();
  _headers.clear();
  _decodedPath.clear();
  _body.clear();
  _methodStr = {};
  _target = {};
  _path = {};
  _query = {};
  _contentLength = 0;
  _method = http::Method::GET;
  _keepAlive = true;
}

}  // namespace tern
