#include "tern/error-response.hpp"

#include <string>

#include "tern/error-kind.hpp"
#include "tern/http-constants.hpp"
#include "tern/http-method.hpp"
#include "tern/http-response.hpp"
#include "tern/http-status-code.hpp"

namespace tern {

http::StatusCode StatusCodeFor(http::ErrorKind kind) noexcept {
  switch (kind) {
    case http::ErrorKind::None:
      return http::StatusCodeOK;
    case http::ErrorKind::Malformed:
      [[fallthrough]];
    case http::ErrorKind::MissingHost:
      return http::StatusCodeBadRequest;
    case http::ErrorKind::UnknownMethod:
      return http::StatusCodeNotImplemented;
    case http::ErrorKind::UnsupportedVersion:
      return http::StatusCodeHTTPVersionNotSupported;
    case http::ErrorKind::HeadTooLarge:
      return http::StatusCodeRequestHeaderFieldsTooLarge;
    case http::ErrorKind::BodyTooLarge:
      return http::StatusCodePayloadTooLarge;
    case http::ErrorKind::TransferEncodingUnsupported:
      return http::StatusCodeLengthRequired;
    case http::ErrorKind::UriTooLong:
      return http::StatusCodeURITooLong;
    case http::ErrorKind::ReadTimeout:
      return http::StatusCodeRequestTimeout;
    case http::ErrorKind::HandlerTimeout:
      return http::StatusCodeGatewayTimeout;
    case http::ErrorKind::NotFound:
      return http::StatusCodeNotFound;
    case http::ErrorKind::MethodNotAllowed:
      return http::StatusCodeMethodNotAllowed;
    default:
      return http::StatusCodeInternalServerError;
  }
}

bool ClosesConnection(http::ErrorKind kind) noexcept {
  switch (kind) {
    case http::ErrorKind::None:
      [[fallthrough]];
    case http::ErrorKind::UnknownMethod:
      [[fallthrough]];
    case http::ErrorKind::NotFound:
      [[fallthrough]];
    case http::ErrorKind::MethodNotAllowed:
      return false;
    default:
      return true;
  }
}

HttpResponse ErrorResponseFor(http::ErrorKind kind) {
  const http::StatusCode statusCode = StatusCodeFor(kind);
  return HttpResponse(statusCode).body(std::string(http::ReasonPhraseFor(statusCode)));
}

HttpResponse MethodNotAllowedResponse(http::MethodBmp allowedMethods) {
  return ErrorResponseFor(http::ErrorKind::MethodNotAllowed).header(http::Allow, AllowHeaderValue(allowedMethods));
}

std::string AllowHeaderValue(http::MethodBmp methods) {
  std::string value;
  for (http::MethodIdx methodIdx = 0; methodIdx < http::kNbMethods; ++methodIdx) {
    const http::Method method = http::MethodFromIdx(methodIdx);
    if (http::IsMethodSet(methods, method)) {
      if (!value.empty()) {
        value.append(", ");
      }
      value.append(http::MethodToStr(method));
    }
  }
  return value;
}

}  // namespace tern
