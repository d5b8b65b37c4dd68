#include "ReactScheduler/ReactExpirationTime.h"

#include "shared/ReactFeatureFlags.h"

#include <cmath>

namespace reactdom {

ExpirationTime msToExpirationTime(double ms) {
  if (!(ms > 0.0)) {
    return kMagicExpirationOffset;
  }
  return static_cast<ExpirationTime>(std::floor(ms / expirationUnitSizeMs)) + kMagicExpirationOffset;
}

ExpirationTime computeExpiration(double currentTimeMs, SchedulerPriority priority) {
  const auto timeoutUnits =
    static_cast<ExpirationTime>(std::ceil(priorityToTimeout(priority) / expirationUnitSizeMs));
  return msToExpirationTime(currentTimeMs) + timeoutUnits;
}

ExpirationTime ExpirationClock::computeUniqueExpiration(double currentTimeMs, SchedulerPriority priority) {
  ExpirationTime result = computeExpiration(currentTimeMs, priority);
  if (result <= lastUniqueExpiration_) {
    result = lastUniqueExpiration_ + 1;
  }
  lastUniqueExpiration_ = result;
  return result;
}

} // namespace reactdom
