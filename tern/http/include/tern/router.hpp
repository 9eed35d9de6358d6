#pragma once

#include <array>
#include <cstdint>
#include <functional>
#include <limits>
#include <string>
#include <string_view>
#include <utility>

#include "tern/http-method.hpp"
#include "tern/http-response.hpp"
#include "tern/path-params.hpp"
#include "tern/vector.hpp"

namespace tern {

class HttpRequest;

// A handler may be invoked concurrently from several threads, it needs to protect any mutable state it shares.
using RequestHandler = std::function<HttpResponse(const HttpRequest&, const PathParams&)>;

// Method and path pattern aware request router.
//
// Patterns are absolute paths made of '/'-separated segments, each one being either a literal or a named
// parameter ':name'. Examples:
//   "/"                  root only
//   "/users/:id"         matches "/users/42" with id=42
//   "/users/:id/posts"   matches "/users/42/posts"
// A trailing slash is normalized away (except for the root), so "/users/" and "/users" are the same route.
// The special pattern "*" matches the asterisk-form target of 'OPTIONS *'.
//
// Routes are stored in a trie keyed by segment. A node has any number of literal edges and at most one
// parameter edge. Matching prefers literal edges at every level and backtracks to the parameter edge if the
// literal branch does not lead to a route.
//
// Threading: routes are registered from a single thread before the server starts. Once frozen, the router is
// immutable and match() can be called concurrently.
class Router {
 public:
  struct RoutingResult {
    enum class Outcome : uint8_t { NotFound, MethodNotAllowed, Matched };

    [[nodiscard]] bool matched() const noexcept { return outcome == Outcome::Matched; }

    Outcome outcome{Outcome::NotFound};

    // Non null only when Matched. Points into the Router, valid as long as it is not modified.
    const RequestHandler* handler{nullptr};

    // Captured parameters, only when Matched.
    PathParams pathParams;

    // Methods registered for the path (HEAD included when GET is), only when MethodNotAllowed.
    http::MethodBmp allowedMethods{};
  };

  // Creates an empty, not frozen router.
  Router();

  // Register a handler for a method and a path pattern.
  // Throws:
  //  - std::invalid_argument if the pattern is malformed (not starting with '/', empty segment, empty or
  //    duplicated parameter name, parameter name conflicting with another route at the same position) or if the
  //    handler is empty.
  //  - std::logic_error if the same (method, pattern) is already registered, or if the router is frozen.
  void route(http::Method method, std::string_view pattern, RequestHandler handler);

  // Register the same handler for several methods. Either all methods are registered, or none.
  void route(http::MethodBmp methods, std::string_view pattern, RequestHandler handler);

  void setPath(http::Method method, std::string_view pattern, RequestHandler handler) {
    route(method, pattern, std::move(handler));
  }

  void setPath(http::MethodBmp methods, std::string_view pattern, RequestHandler handler) {
    route(methods, pattern, std::move(handler));
  }

  // Match the raw (not yet percent-decoded) request path for method.
  // Each path segment is percent-decoded once before being compared to literals or captured.
  // HEAD semantics: if no explicit HEAD handler is registered for a matching path, the GET handler is returned.
  // Outcomes are exclusive: Matched with a handler, MethodNotAllowed with a non empty allowedMethods, or NotFound.
  [[nodiscard]] RoutingResult match(http::Method method, std::string_view path) const;

  // Union of the methods registered for all routes matching path (HEAD implied by GET), 0 if none.
  [[nodiscard]] http::MethodBmp allowedMethods(std::string_view path) const;

  // After this call, any attempt to register a route throws std::logic_error.
  void freeze() noexcept { _frozen = true; }

  [[nodiscard]] bool frozen() const noexcept { return _frozen; }

  [[nodiscard]] bool empty() const noexcept { return _nbRoutes == 0; }

 private:
  static constexpr uint32_t kNoNode = std::numeric_limits<uint32_t>::max();
  static constexpr uint32_t kRootNode = 0;
  static constexpr uint32_t kAsteriskNode = 1;

  struct CompiledSegment {
    std::string_view text;  // literal text, or parameter name (without ':')
    bool isParam{false};
  };

  struct RouteNode {
    vector<std::pair<std::string, uint32_t>> literalChildren;  // sorted by literal
    std::string paramName;                                     // non empty if paramChild != kNoNode
    uint32_t paramChild{kNoNode};
    http::MethodBmp methodBmp{};
    std::array<RequestHandler, http::kNbMethods> handlers;
  };

  struct StackFrame {
    uint32_t nodeIdx;
    uint32_t segmentIndex;
    uint32_t nbCaptures;
    uint8_t stage;  // 0: literal edge to try, 1: parameter edge to try, 2: exhausted
  };

  struct Capture {
    uint32_t ownerNodeIdx;
    uint32_t segmentIndex;
  };

  static vector<CompiledSegment> CompilePattern(std::string_view pattern);

  uint32_t ensureLiteralChild(uint32_t nodeIdx, std::string_view literal);
  uint32_t ensureParamChild(uint32_t nodeIdx, std::string_view paramName, std::string_view pattern);

  // Walks the trie for path. Returns the index of the first terminal node accepting *pMethod, or kNoNode.
  // Accumulates in allowed the methods of all terminal nodes reached. With a null pMethod, all terminal nodes
  // matching path are visited.
  uint32_t matchImpl(const http::Method* pMethod, std::string_view path, http::MethodBmp& allowed,
                     PathParams* pPathParams) const;

  [[nodiscard]] const RequestHandler* handlerFor(const RouteNode& node, http::Method method) const noexcept;

  // Node 0 is the root '/', node 1 the asterisk-form target '*'.
  vector<RouteNode> _nodes;
  uint32_t _nbRoutes{};
  bool _frozen{false};
};

using RoutingResult = Router::RoutingResult;

}  // namespace tern
