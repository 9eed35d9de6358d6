#include "tern/http-response.hpp"

#include <algorithm>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/format.h>

#include "tern/ascii-chars.hpp"
#include "tern/http-constants.hpp"
#include "tern/http-header.hpp"
#include "tern/http-status-code.hpp"
#include "tern/string-equal-ignore-case.hpp"

namespace tern {

HttpResponse::HttpResponse(http::StatusCode code) { setStatus(code); }

void HttpResponse::setStatus(http::StatusCode code) {
  if (!http::IsValidStatusCode(code)) {
    throw std::invalid_argument(fmt::format("Invalid HTTP status code {}", code));
  }
  _status = code;
}

std::optional<std::string_view> HttpResponse::headerValue(std::string_view name) const noexcept {
  const auto it = std::ranges::find_if(
      _headers, [name](const http::Header& header) { return CaseInsensitiveEqual(header.name, name); });
  if (it == _headers.end()) {
    return std::nullopt;
  }
  return std::string_view(it->value);
}

void HttpResponse::setHeader(std::string_view name, std::string_view value, bool replace) {
  if (!IsToken(name)) {
    throw std::invalid_argument(fmt::format("Invalid header name '{}'", name));
  }
  if (!std::ranges::all_of(value, http::IsValidHeaderValueChar)) {
    throw std::invalid_argument(fmt::format("Invalid value for header '{}'", name));
  }
  if (replace) {
    const auto [first, last] = std::ranges::remove_if(
        _headers, [name](const http::Header& header) { return CaseInsensitiveEqual(header.name, name); });
    _headers.erase(first, last);
  }
  _headers.push_back(http::Header{std::string(name), std::string(value)});
}

void HttpResponse::setBody(std::string body, std::string_view contentType) {
  _body = std::move(body);
  if (!contentType.empty()) {
    setHeader(http::ContentType, contentType, true);
  }
}

}  // namespace tern
