#pragma once

#include "ReactScheduler/SchedulerFeatureFlags.h"

#include <cstdint>

namespace reactdom {

enum class SchedulerPriority : std::uint8_t {
  NoPriority = 0,
  ImmediatePriority = 1,
  UserBlockingPriority = 2,
  NormalPriority = 3,
  LowPriority = 4,
  IdlePriority = 5,
};

inline constexpr SchedulerPriority NoPriority = SchedulerPriority::NoPriority;
inline constexpr SchedulerPriority ImmediatePriority = SchedulerPriority::ImmediatePriority;
inline constexpr SchedulerPriority UserBlockingPriority = SchedulerPriority::UserBlockingPriority;
inline constexpr SchedulerPriority NormalPriority = SchedulerPriority::NormalPriority;
inline constexpr SchedulerPriority LowPriority = SchedulerPriority::LowPriority;
inline constexpr SchedulerPriority IdlePriority = SchedulerPriority::IdlePriority;

constexpr bool isValidPriority(SchedulerPriority priority) {
  return priority >= SchedulerPriority::NoPriority && priority <= SchedulerPriority::IdlePriority;
}

// How long work of a given priority may wait before it counts as expired.
constexpr double priorityToTimeout(SchedulerPriority priority) {
  switch (priority) {
    case SchedulerPriority::ImmediatePriority:
      return 0.0;
    case SchedulerPriority::UserBlockingPriority:
      return userBlockingPriorityTimeout;
    case SchedulerPriority::NormalPriority:
      return normalPriorityTimeout;
    case SchedulerPriority::LowPriority:
      return lowPriorityTimeout;
    case SchedulerPriority::IdlePriority:
      return maxSigned31BitInt;
    case SchedulerPriority::NoPriority:
    default:
      return normalPriorityTimeout;
  }
}

} // namespace reactdom
