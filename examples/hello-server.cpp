#include <tern/tern.hpp>

#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <iostream>
#include <string>
#include <utility>

using namespace tern;

int main(int argc, char **argv) {
  uint16_t port = 8080;
  if (argc > 1) {
    const auto [ptr, errc] = std::from_chars(argv[1], argv[1] + std::strlen(argv[1]), port);
    if (errc != std::errc{} || ptr != argv[1] + std::strlen(argv[1])) {
      std::cerr << "Invalid port number: " << argv[1] << "\n";
      return EXIT_FAILURE;
    }
  }

  log::set_level(log::level::info);

  // Enable signal handler for graceful shutdown on Ctrl+C
  SignalHandler::Enable();

  Router router;

  try {
    router.route(http::Method::GET, "/", [](const HttpRequest &, const PathParams &) {
      return HttpResponse("<html><body><h1>Welcome to tern</h1><p>Try /hello or /users/42</p></body></html>",
                          http::ContentTypeTextHtml);
    });
    router.route(http::Method::GET, "/hello", [](const HttpRequest &req, const PathParams &) {
      std::string body("<html><body><h1>Hello!</h1><p>Served to ");
      body.append(req.peer()).append("</p></body></html>");
      return HttpResponse(std::move(body), http::ContentTypeTextHtml);
    });
    router.route(http::Method::GET, "/users/:id", [](const HttpRequest &, const PathParams &params) {
      std::string body("user ");
      body.append(params.valueOrEmpty("id"));
      return HttpResponse(std::move(body), http::ContentTypeTextPlain);
    });

    HttpServer server(HttpServerConfig{}.withPort(port).withMaxConnections(1000), std::move(router));
    server.listen();  // blocking, until Ctrl+C
  } catch (const std::exception &e) {
    std::cerr << "Server encountered error: " << e.what() << '\n';
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
