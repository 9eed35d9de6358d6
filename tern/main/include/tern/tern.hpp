// tern Umbrella Header
//
// Include this single header to pull in the public HTTP server API:
//   - HttpServer and its configuration
//   - Router, handlers and path parameters
//   - Request / Response primitives and HTTP enums
//   - Server statistics and signal driven shutdown
//
// Usage Example:
//    #include <tern/tern.hpp>
//    using namespace tern;
//    int main() {
//      Router router;
//      router.route(http::Method::GET, "/", [](const HttpRequest&, const PathParams&) {
//         return HttpResponse("hi\n");
//      });
//      HttpServer server(HttpServerConfig{}.withPort(8080), std::move(router));
//      server.listen();
//    }
#pragma once

// IWYU pragma: begin_exports
#include "tern/http-constants.hpp"
#include "tern/http-method.hpp"
#include "tern/http-request.hpp"
#include "tern/http-response.hpp"
#include "tern/http-server-config.hpp"
#include "tern/http-server.hpp"
#include "tern/http-status-code.hpp"
#include "tern/log.hpp"
#include "tern/path-params.hpp"
#include "tern/router.hpp"
#include "tern/server-stats.hpp"
#include "tern/signal-handler.hpp"
// IWYU pragma: end_exports
