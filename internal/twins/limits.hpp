#pragma once

#include <cstddef>

namespace twingraph::twins {

struct EntityLimits {
  std::size_t max_batch_relationships = 100;
  // Compare-and-swap attempts for an update without If-Match.
  std::size_t max_update_retries = 3;
};

} // namespace twingraph::twins
