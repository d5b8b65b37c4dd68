#pragma once

#include "ReactScheduler/SchedulerPriorities.h"

#include <cstdint>
#include <limits>

namespace reactdom {

// Smaller is more urgent.
using ExpirationTime = std::uint64_t;

inline constexpr ExpirationTime NoWork = 0;
inline constexpr ExpirationTime Never = std::numeric_limits<ExpirationTime>::max();

// Reserves NoWork so that the earliest real tick still maps to a non-zero value.
inline constexpr ExpirationTime kMagicExpirationOffset = 1;

[[nodiscard]] ExpirationTime msToExpirationTime(double ms);

[[nodiscard]] ExpirationTime computeExpiration(double currentTimeMs, SchedulerPriority priority);

/**
 * Issues expiration times for batches.
 *
 * Two batches created in the same tick must still be committable on their
 * own, so every value handed out is strictly greater than the previous one.
 */
class ExpirationClock {
public:
  ExpirationTime computeUniqueExpiration(double currentTimeMs, SchedulerPriority priority);

  [[nodiscard]] ExpirationTime lastUniqueExpiration() const noexcept {
    return lastUniqueExpiration_;
  }

private:
  ExpirationTime lastUniqueExpiration_{NoWork};
};

} // namespace reactdom
