#pragma once

#include "ReactRuntime/ReactJSXRuntime.h"

#include <string>
#include <vector>

namespace reactdom {

struct PropertyDiff {
  // Present only in nextProps.
  std::vector<std::string> added;
  // Present only in prevProps.
  std::vector<std::string> removed;
  // Present in both with different values.
  std::vector<std::string> changed;

  [[nodiscard]] bool empty() const noexcept {
    return added.empty() && removed.empty() && changed.empty();
  }
};

[[nodiscard]] PropertyDiff diffHostProperties(const Props& prevProps, const Props& nextProps);

} // namespace reactdom
