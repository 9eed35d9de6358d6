#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

#include "tern/vector.hpp"

namespace tern {

struct PathParam {
  std::string name;
  // Percent-decoded segment value.
  std::string value;

  bool operator==(const PathParam&) const noexcept = default;
};

// Named path parameters captured by a matched route, in pattern order.
// Contains exactly the parameter names declared in the pattern.
class PathParams {
 public:
  using const_iterator = const PathParam*;

  [[nodiscard]] std::optional<std::string_view> get(std::string_view name) const noexcept {
    for (const PathParam& param : _params) {
      if (param.name == name) {
        return std::string_view(param.value);
      }
    }
    return std::nullopt;
  }

  [[nodiscard]] std::string_view valueOrEmpty(std::string_view name) const noexcept {
    return get(name).value_or(std::string_view{});
  }

  [[nodiscard]] bool contains(std::string_view name) const noexcept { return get(name).has_value(); }

  [[nodiscard]] std::size_t size() const noexcept { return _params.size(); }

  [[nodiscard]] bool empty() const noexcept { return _params.empty(); }

  [[nodiscard]] const_iterator begin() const noexcept { return _params.data(); }
  [[nodiscard]] const_iterator end() const noexcept { return _params.data() + _params.size(); }

  bool operator==(const PathParams&) const noexcept = default;

 private:
  friend class Router;

  vector<PathParam> _params;
};

}  // namespace tern
