#pragma once

#include <cstdint>
#include <string_view>

namespace tern::http {

// Per-request failure kinds, from framing and parsing up to handler execution.
// RequestParser only reports the kinds up to UriTooLong.
enum class ErrorKind : uint8_t {
  None,
  Malformed,
  UnknownMethod,
  UnsupportedVersion,
  MissingHost,
  HeadTooLarge,
  BodyTooLarge,
  TransferEncodingUnsupported,
  UriTooLong,
  ReadTimeout,
  HandlerTimeout,
  HandlerFailure,
  NotFound,
  MethodNotAllowed,
};

using ParseError = ErrorKind;

// Coarse classification of a parse failure, as reported in logs.
enum class FailureClass : uint8_t { None, Malformed, Unsupported, TooLarge };

constexpr FailureClass FailureClassOf(ErrorKind kind) noexcept {
  switch (kind) {
    case ErrorKind::Malformed:
      [[fallthrough]];
    case ErrorKind::MissingHost:
      return FailureClass::Malformed;
    case ErrorKind::UnknownMethod:
      [[fallthrough]];
    case ErrorKind::UnsupportedVersion:
      [[fallthrough]];
    case ErrorKind::TransferEncodingUnsupported:
      return FailureClass::Unsupported;
    case ErrorKind::HeadTooLarge:
      [[fallthrough]];
    case ErrorKind::BodyTooLarge:
      [[fallthrough]];
    case ErrorKind::UriTooLong:
      return FailureClass::TooLarge;
    default:
      return FailureClass::None;
  }
}

constexpr std::string_view ErrorKindToStr(ErrorKind kind) noexcept {
  switch (kind) {
    case ErrorKind::None:
      return "none";
    case ErrorKind::Malformed:
      return "malformed";
    case ErrorKind::UnknownMethod:
      return "unknown-method";
    case ErrorKind::UnsupportedVersion:
      return "unsupported-version";
    case ErrorKind::MissingHost:
      return "missing-host";
    case ErrorKind::HeadTooLarge:
      return "head-too-large";
    case ErrorKind::BodyTooLarge:
      return "body-too-large";
    case ErrorKind::TransferEncodingUnsupported:
      return "transfer-encoding-unsupported";
    case ErrorKind::UriTooLong:
      return "uri-too-long";
    case ErrorKind::ReadTimeout:
      return "read-timeout";
    case ErrorKind::HandlerTimeout:
      return "handler-timeout";
    case ErrorKind::HandlerFailure:
      return "handler-failure";
    case ErrorKind::NotFound:
      return "not-found";
    case ErrorKind::MethodNotAllowed:
      return "method-not-allowed";
    default:
      return "unknown";
  }
}

constexpr std::string_view FailureClassToStr(FailureClass failureClass) noexcept {
  switch (failureClass) {
    case FailureClass::Malformed:
      return "Malformed";
    case FailureClass::Unsupported:
      return "Unsupported";
    case FailureClass::TooLarge:
      return "TooLarge";
    default:
      return "None";
  }
}

}  // namespace tern::http
