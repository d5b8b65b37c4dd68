#pragma once

#include "ReactReconciler/ReactHostConfig.h"

#include <string>
#include <vector>

namespace reactdom {

struct HydrationResult {
  bool matched{true};
  std::vector<std::string> mismatches;
};

// Compares markup already in a container with freshly rendered nodes.
// Stops at the first structural difference; attribute differences are all collected.
[[nodiscard]] HydrationResult matchHydratableChildren(
  const std::vector<hostconfig::HostInstance>& existing,
  const std::vector<hostconfig::HostInstance>& rendered,
  const std::string& parentType);

} // namespace reactdom
