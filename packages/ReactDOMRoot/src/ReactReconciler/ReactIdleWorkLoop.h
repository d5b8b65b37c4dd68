#pragma once

#include "ReactReconciler/ReactUpdateQueue.h"
#include "ReactScheduler/IdleCallbackHost.h"

#include <cstdint>
#include <memory>
#include <utility>
#include <vector>

namespace reactdom {

class ReactDOMRoot;

/**
 * Drives pending updates of every root through idle slices handed out by the
 * host.
 *
 * One unit of work is one update: render, then commit if it is unbatched.
 * Batched updates are rendered ahead of time and left for ReactBatch::commit.
 * The loop only stops between units and never holds a root alive.
 */
class IdleWorkLoop {
public:
  explicit IdleWorkLoop(std::shared_ptr<IdleCallbackHost> host);
  ~IdleWorkLoop();

  IdleWorkLoop(const IdleWorkLoop&) = delete;
  IdleWorkLoop& operator=(const IdleWorkLoop&) = delete;

  void scheduleRoot(const std::shared_ptr<ReactDOMRoot>& root);
  void unscheduleRoot(const ReactDOMRoot* root);

  // Requests one idle callback unless one is already outstanding.
  void scheduleCallback();

  void onIdleSlice(const IdleDeadline& deadline);

  // Drains and commits the updates of `root` accepted by `predicate`, ignoring deadlines.
  void flushSync(ReactDOMRoot& root, const UpdatePredicate& predicate);

  [[nodiscard]] bool hasScheduledCallback() const noexcept { return static_cast<bool>(callbackToken_); }
  [[nodiscard]] bool hasIdleWork();

  [[nodiscard]] double now() const;
  [[nodiscard]] std::uint64_t nextUpdateId() noexcept { return nextUpdateId_++; }

private:
  using WorkUnit = std::pair<std::shared_ptr<ReactDOMRoot>, PendingUpdate*>;

  WorkUnit findNextUnit();
  bool isExpired(const PendingUpdate& update) const;
  void cancelCallback();
  void settleCallback();

  std::shared_ptr<IdleCallbackHost> host_;
  std::vector<std::weak_ptr<ReactDOMRoot>> scheduledRoots_;
  IdleCallbackToken callbackToken_{};
  std::uint64_t callbackGeneration_{0};
  std::uint64_t nextUpdateId_{1};
};

} // namespace reactdom
