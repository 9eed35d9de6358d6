#pragma once

#include <string>
#include <string_view>

#include "tern/timedef.hpp"

namespace tern {

class HttpResponse;

struct SerializeOptions {
  std::string_view serverName{"tern"};
  SysTimePoint now{};
  // For HEAD requests the body is not written, but Content-Length still reflects its size.
  bool headRequest{false};
  bool keepAlive{true};
};

class ResponseSerializer {
 public:
  // Produce the full wire form of 'response' in a single buffer:
  //   status line, handler headers (minus the reserved ones), Date, Server, Content-Length, Connection,
  //   empty line and body.
  [[nodiscard]] static std::string serialize(const HttpResponse& response, const SerializeOptions& options);

  // Tells whether the handler asked for the connection to be closed with a 'Connection: close' header.
  [[nodiscard]] static bool HandlerRequestsClose(const HttpResponse& response) noexcept;

  // Headers always written by the serializer, whatever the handler set.
  [[nodiscard]] static bool IsReservedHeader(std::string_view name) noexcept;
};

}  // namespace tern
