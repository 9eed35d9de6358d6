#pragma once

#include <absl/container/flat_hash_map.h>

namespace tern {

template <typename K, typename V, typename H = typename absl::flat_hash_map<K, V>::hasher,
          typename E = typename absl::flat_hash_map<K, V, H>::key_equal>
using flat_hash_map = absl::flat_hash_map<K, V, H, E>;

}  // namespace tern
