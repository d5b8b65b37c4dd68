#include "ReactScheduler/ReactExpirationTime.h"
#include "ReactScheduler/SchedulerPriorities.h"

#include <cassert>

namespace reactdom::test {

bool runReactExpirationTimeTests() {
  assert(msToExpirationTime(0.0) == 1);
  assert(msToExpirationTime(-5.0) == 1);
  assert(msToExpirationTime(10.7) == 11);
  assert(msToExpirationTime(2000.0) == 2001);

  assert(priorityToTimeout(ImmediatePriority) == 0.0);
  assert(priorityToTimeout(UserBlockingPriority) == 250.0);
  assert(priorityToTimeout(NormalPriority) == 5000.0);
  assert(priorityToTimeout(LowPriority) == 10000.0);
  assert(priorityToTimeout(IdlePriority) == 1073741823.0);
  assert(priorityToTimeout(NoPriority) == priorityToTimeout(NormalPriority));

  // Same tick and priority coalesce; later ticks are strictly later.
  assert(computeExpiration(0.0, NormalPriority) == 5001);
  assert(computeExpiration(0.4, NormalPriority) == computeExpiration(0.9, NormalPriority));
  assert(computeExpiration(1.0, NormalPriority) > computeExpiration(0.0, NormalPriority));
  assert(computeExpiration(2000.0, NormalPriority) == 7001);

  // More urgent priorities expire sooner.
  assert(computeExpiration(100.0, ImmediatePriority) == msToExpirationTime(100.0));
  assert(computeExpiration(100.0, UserBlockingPriority) < computeExpiration(100.0, NormalPriority));
  assert(computeExpiration(100.0, NormalPriority) < computeExpiration(100.0, LowPriority));
  assert(computeExpiration(100.0, LowPriority) < computeExpiration(100.0, IdlePriority));
  assert(computeExpiration(100.0, IdlePriority) < Never);

  ExpirationClock clock;
  assert(clock.lastUniqueExpiration() == NoWork);

  const ExpirationTime first = clock.computeUniqueExpiration(0.0, NormalPriority);
  const ExpirationTime second = clock.computeUniqueExpiration(0.0, NormalPriority);
  const ExpirationTime third = clock.computeUniqueExpiration(0.0, NormalPriority);
  assert(first == 5001);
  assert(second == first + 1);
  assert(third == second + 1);
  assert(clock.lastUniqueExpiration() == third);

  // A later tick past the bumped values is used as is.
  assert(clock.computeUniqueExpiration(2000.0, NormalPriority) == 7001);

  // An earlier-expiring priority never goes below what was already issued.
  const ExpirationTime urgent = clock.computeUniqueExpiration(2000.0, ImmediatePriority);
  assert(urgent == 7002);

  return true;
}

} // namespace reactdom::test
