#include <benchmark/benchmark.h>

#include <cstddef>
#include <string>
#include <string_view>

#include "tern/error-kind.hpp"
#include "tern/http-request.hpp"
#include "tern/request-parser.hpp"

namespace {

std::string BuildHead(std::size_t nbHeaders) {
  std::string head = "GET /api/v1/users/12345/orders?limit=10&offset=20 HTTP/1.1\r\nHost: bench.local\r\n";
  for (std::size_t headerPos = 0; headerPos < nbHeaders; ++headerPos) {
    head.append("X-Header-").append(std::to_string(headerPos)).append(": some-reasonably-long-value\r\n");
  }
  head.append("\r\n");
  return head;
}

void BM_ScanHead(benchmark::State& state) {
  const std::string head = BuildHead(static_cast<std::size_t>(state.range(0)));
  const tern::RequestParser parser;
  for ([[maybe_unused]] auto iter : state) {
    benchmark::DoNotOptimize(parser.scanHead(head));
  }
  state.SetBytesProcessed(static_cast<int64_t>(state.iterations()) * static_cast<int64_t>(head.size()));
}

void BM_ParseHead(benchmark::State& state) {
  const std::string head = BuildHead(static_cast<std::size_t>(state.range(0)));
  const tern::RequestParser parser;
  tern::HttpRequest request;
  for ([[maybe_unused]] auto iter : state) {
    const auto err = parser.parseHead(head, request);
    if (err != tern::http::ErrorKind::None) {
      state.SkipWithError("parse failed");
      break;
    }
    benchmark::DoNotOptimize(request.path());
  }
  state.SetBytesProcessed(static_cast<int64_t>(state.iterations()) * static_cast<int64_t>(head.size()));
}

}  // namespace

BENCHMARK(BM_ScanHead)->Arg(2)->Arg(20)->Arg(100);
BENCHMARK(BM_ParseHead)->Arg(2)->Arg(20)->Arg(100);

BENCHMARK_MAIN();
