#include "ReactDOM/client/ReactDOMDiffProperties.h"

namespace reactdom {

PropertyDiff diffHostProperties(const Props& prevProps, const Props& nextProps) {
  PropertyDiff diff;

  // Both maps are ordered by name, so one merge pass finds every difference.
  auto prevIt = prevProps.begin();
  auto nextIt = nextProps.begin();
  while (prevIt != prevProps.end() || nextIt != nextProps.end()) {
    if (nextIt == nextProps.end() || (prevIt != prevProps.end() && prevIt->first < nextIt->first)) {
      diff.removed.push_back(prevIt->first);
      ++prevIt;
    } else if (prevIt == prevProps.end() || nextIt->first < prevIt->first) {
      diff.added.push_back(nextIt->first);
      ++nextIt;
    } else {
      if (prevIt->second != nextIt->second) {
        diff.changed.push_back(nextIt->first);
      }
      ++prevIt;
      ++nextIt;
    }
  }

  return diff;
}

} // namespace reactdom
