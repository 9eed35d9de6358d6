#include "tern/router.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/format.h>

#include "tern/http-method.hpp"
#include "tern/log.hpp"
#include "tern/path-params.hpp"
#include "tern/url-decode.hpp"
#include "tern/vector.hpp"

namespace tern {

namespace {

constexpr std::string_view kAsteriskTarget = "*";

// Removes a single trailing slash, except for the root.
constexpr std::string_view NormalizeTrailingSlash(std::string_view path) noexcept {
  if (path.size() > 1 && path.back() == '/') {
    path.remove_suffix(1);
  }
  return path;
}

constexpr http::MethodBmp WithImpliedHead(http::MethodBmp methodBmp) noexcept {
  if (http::IsMethodSet(methodBmp, http::Method::GET)) {
    methodBmp = methodBmp | http::Method::HEAD;
  }
  return methodBmp;
}

}  // namespace

Router::Router() { _nodes.resize(2); }

vector<Router::CompiledSegment> Router::CompilePattern(std::string_view pattern) {
  vector<CompiledSegment> segments;
  if (pattern == kAsteriskTarget) {
    return segments;
  }
  if (pattern.empty() || pattern.front() != '/') {
    throw std::invalid_argument(fmt::format("Route pattern '{}' should start with '/'", pattern));
  }
  std::string_view remaining = NormalizeTrailingSlash(pattern).substr(1);
  while (!remaining.empty()) {
    const std::size_t slashPos = remaining.find('/');
    const std::string_view segment = remaining.substr(0, slashPos);
    remaining.remove_prefix(slashPos == std::string_view::npos ? remaining.size() : slashPos + 1);
    if (segment.empty()) {
      throw std::invalid_argument(fmt::format("Route pattern '{}' contains an empty segment", pattern));
    }
    if (segment.front() == ':') {
      const std::string_view paramName = segment.substr(1);
      if (paramName.empty()) {
        throw std::invalid_argument(fmt::format("Route pattern '{}' has an unnamed parameter", pattern));
      }
      if (std::ranges::any_of(segments, [paramName](const CompiledSegment& compiledSegment) {
            return compiledSegment.isParam && compiledSegment.text == paramName;
          })) {
        throw std::invalid_argument(
            fmt::format("Route pattern '{}' declares parameter '{}' more than once", pattern, paramName));
      }
      segments.push_back(CompiledSegment{paramName, true});
    } else {
      segments.push_back(CompiledSegment{segment, false});
    }
  }
  return segments;
}

uint32_t Router::ensureLiteralChild(uint32_t nodeIdx, std::string_view literal) {
  auto& children = _nodes[nodeIdx].literalChildren;
  auto it = std::ranges::lower_bound(children, literal, {}, [](const auto& child) { return std::string_view(child.first); });
  if (it != children.end() && it->first == literal) {
    return it->second;
  }
  const auto childIdx = static_cast<uint32_t>(_nodes.size());
  // Insert before growing _nodes, which may reallocate and invalidate 'children'.
  children.insert(it, std::pair<std::string, uint32_t>(std::string(literal), childIdx));
  _nodes.emplace_back();
  return childIdx;
}

uint32_t Router::ensureParamChild(uint32_t nodeIdx, std::string_view paramName, std::string_view pattern) {
  RouteNode& node = _nodes[nodeIdx];
  if (node.paramChild != kNoNode) {
    if (node.paramName != paramName) {
      throw std::invalid_argument(
          fmt::format("Route pattern '{}' uses parameter ':{}' where ':{}' is already registered", pattern,
                      paramName, node.paramName));
    }
    return node.paramChild;
  }
  const auto childIdx = static_cast<uint32_t>(_nodes.size());
  node.paramName = paramName;
  node.paramChild = childIdx;
  _nodes.emplace_back();
  return childIdx;
}

void Router::route(http::Method method, std::string_view pattern, RequestHandler handler) {
  route(static_cast<http::MethodBmp>(method), pattern, std::move(handler));
}

void Router::route(http::MethodBmp methods, std::string_view pattern, RequestHandler handler) {
  if (_frozen) {
    throw std::logic_error(fmt::format("Cannot register route '{}' once the server has started", pattern));
  }
  if (!handler) {
    throw std::invalid_argument(fmt::format("Empty handler for route '{}'", pattern));
  }
  if (methods == 0 || (methods & ~http::kAllMethodsBmp) != 0) {
    throw std::invalid_argument(fmt::format("Invalid method set for route '{}'", pattern));
  }

  const auto segments = CompilePattern(pattern);

  uint32_t nodeIdx = pattern == kAsteriskTarget ? kAsteriskNode : kRootNode;
  for (const CompiledSegment& segment : segments) {
    nodeIdx = segment.isParam ? ensureParamChild(nodeIdx, segment.text, pattern)
                              : ensureLiteralChild(nodeIdx, segment.text);
  }

  RouteNode& node = _nodes[nodeIdx];
  if ((node.methodBmp & methods) != 0) {
    throw std::logic_error(fmt::format("A route is already registered for pattern '{}' and one of its methods",
                                       NormalizeTrailingSlash(pattern)));
  }
  for (http::MethodIdx methodIdx = 0; methodIdx < http::kNbMethods; ++methodIdx) {
    const http::Method method = http::MethodFromIdx(methodIdx);
    if (http::IsMethodSet(methods, method)) {
      node.handlers[methodIdx] = handler;
      ++_nbRoutes;
      log::debug("Registered route {} {}", http::MethodToStr(method), NormalizeTrailingSlash(pattern));
    }
  }
  node.methodBmp |= methods;
}

const RequestHandler* Router::handlerFor(const RouteNode& node, http::Method method) const noexcept {
  if (http::IsMethodSet(node.methodBmp, method)) {
    return &node.handlers[http::MethodToIdx(method)];
  }
  if (method == http::Method::HEAD && http::IsMethodSet(node.methodBmp, http::Method::GET)) {
    return &node.handlers[http::MethodToIdx(http::Method::GET)];
  }
  return nullptr;
}

uint32_t Router::matchImpl(const http::Method* pMethod, std::string_view path, http::MethodBmp& allowed,
                           PathParams* pPathParams) const {
  allowed = 0;
  if (path == kAsteriskTarget) {
    const RouteNode& node = _nodes[kAsteriskNode];
    allowed = WithImpliedHead(node.methodBmp);
    return pMethod != nullptr && handlerFor(node, *pMethod) != nullptr ? kAsteriskNode : kNoNode;
  }
  if (path.empty() || path.front() != '/') {
    return kNoNode;
  }

  // Split into raw segments. An empty segment in the middle ("//") never matches a route.
  vector<std::string_view> segments;
  std::size_t nbEncodedSegments = 0;
  for (std::string_view remaining = NormalizeTrailingSlash(path).substr(1); !remaining.empty();) {
    const std::size_t slashPos = remaining.find('/');
    const std::string_view segment = remaining.substr(0, slashPos);
    remaining.remove_prefix(slashPos == std::string_view::npos ? remaining.size() : slashPos + 1);
    if (segment.empty()) {
      return kNoNode;
    }
    segments.push_back(segment);
    nbEncodedSegments += static_cast<std::size_t>(segment.find('%') != std::string_view::npos);
  }

  // Percent-decode only the segments that need it. Storage is reserved upfront so that views stay valid.
  vector<std::string> decodedStorage;
  decodedStorage.reserve(nbEncodedSegments);
  for (std::string_view& segment : segments) {
    if (segment.find('%') != std::string_view::npos) {
      decodedStorage.emplace_back();
      std::string& decoded = decodedStorage.back();
      if (!url::DecodeAppend(segment, decoded)) {
        return kNoNode;
      }
      segment = decoded;
    }
  }

  vector<Capture> captures;
  vector<StackFrame> stack;

  // DFS, literal edges first.
  for (stack.push_back(StackFrame{kRootNode, 0, 0, 0}); !stack.empty();) {
    StackFrame frame = stack.back();
    stack.pop_back();
    captures.resize(frame.nbCaptures);

    const RouteNode& node = _nodes[frame.nodeIdx];

    // Terminal: all segments matched
    if (frame.segmentIndex == segments.size()) {
      if (node.methodBmp == 0) {
        continue;
      }
      allowed |= WithImpliedHead(node.methodBmp);
      if (pMethod == nullptr || handlerFor(node, *pMethod) == nullptr) {
        continue;
      }
      if (pPathParams != nullptr) {
        for (const Capture& capture : captures) {
          pPathParams->_params.push_back(
              PathParam{_nodes[capture.ownerNodeIdx].paramName, std::string(segments[capture.segmentIndex])});
        }
      }
      return frame.nodeIdx;
    }

    const std::string_view segment = segments[frame.segmentIndex];

    if (frame.stage == 0) {
      frame.stage = 1;
      const auto it = std::ranges::lower_bound(node.literalChildren, segment, {},
                                               [](const auto& child) { return std::string_view(child.first); });
      if (it != node.literalChildren.end() && it->first == segment) {
        // Push current frame back for a later retry on the parameter edge, then the child
        stack.push_back(frame);
        stack.push_back(StackFrame{it->second, frame.segmentIndex + 1, static_cast<uint32_t>(captures.size()), 0});
        continue;
      }
    }

    if (frame.stage == 1 && node.paramChild != kNoNode) {
      captures.push_back(Capture{frame.nodeIdx, frame.segmentIndex});
      stack.push_back(
          StackFrame{node.paramChild, frame.segmentIndex + 1, static_cast<uint32_t>(captures.size()), 0});
    }
    // Otherwise this branch is exhausted, backtrack (frame already popped)
  }

  return kNoNode;
}

Router::RoutingResult Router::match(http::Method method, std::string_view path) const {
  RoutingResult result;
  const uint32_t nodeIdx = matchImpl(&method, path, result.allowedMethods, &result.pathParams);
  if (nodeIdx != kNoNode) {
    result.outcome = RoutingResult::Outcome::Matched;
    result.handler = handlerFor(_nodes[nodeIdx], method);
    result.allowedMethods = 0;
  } else if (result.allowedMethods != 0) {
    result.outcome = RoutingResult::Outcome::MethodNotAllowed;
  }
  return result;
}

http::MethodBmp Router::allowedMethods(std::string_view path) const {
  http::MethodBmp allowed{};
  static_cast<void>(matchImpl(nullptr, path, allowed, nullptr));
  return allowed;
}

}  // namespace tern
