#pragma once

#include <string>

#include "tern/error-kind.hpp"
#include "tern/http-method.hpp"
#include "tern/http-response.hpp"
#include "tern/http-status-code.hpp"

namespace tern {

// Status code sent on the wire for a failure kind. ErrorKind::None maps to 200.
[[nodiscard]] http::StatusCode StatusCodeFor(http::ErrorKind kind) noexcept;

// Tells whether the connection is closed after answering this failure.
// UnknownMethod, NotFound and MethodNotAllowed keep the connection open (if the request allows it).
[[nodiscard]] bool ClosesConnection(http::ErrorKind kind) noexcept;

// Builds the response for a failure kind: short plain text reason phrase as body, no internal details.
// For MethodNotAllowed, use MethodNotAllowedResponse instead to fill the Allow header.
[[nodiscard]] HttpResponse ErrorResponseFor(http::ErrorKind kind);

// 405 response with its Allow header.
[[nodiscard]] HttpResponse MethodNotAllowedResponse(http::MethodBmp allowedMethods);

// "GET, HEAD, POST" style list, in the order of the Method enum.
[[nodiscard]] std::string AllowHeaderValue(http::MethodBmp methods);

}  // namespace tern
