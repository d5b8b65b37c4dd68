#pragma once

#include "ReactDOM/client/ReactDOMRoot.h"
#include "ReactReconciler/ReactHostConfig.h"
#include "ReactReconciler/ReactIdleWorkLoop.h"
#include "ReactReconciler/ReactReconciler.h"
#include "ReactScheduler/IdleCallbackHost.h"
#include "ReactScheduler/ReactExpirationTime.h"
#include "ReactScheduler/SchedulerPriorities.h"

#include <cstdint>
#include <functional>
#include <memory>

namespace reactdom {

class HostInterface;

/**
 * Owns everything roots share: the idle work loop, the expiration clock, the
 * current priority, and the reconciler and commit adapter used for every
 * root it creates.
 *
 * Must be owned by a std::shared_ptr; roots keep their runtime alive.
 */
class ReactRuntime : public std::enable_shared_from_this<ReactRuntime> {
public:
  explicit ReactRuntime(std::shared_ptr<IdleCallbackHost> idleCallbackHost);

  ReactRuntime(const ReactRuntime&) = delete;
  ReactRuntime& operator=(const ReactRuntime&) = delete;

  std::shared_ptr<ReactDOMRoot> createRoot(
    hostconfig::HostContainer container,
    RootOptions options = {});

  // Replacing the host interface also rebuilds the default reconciler and commit adapter.
  void setHostInterface(std::shared_ptr<HostInterface> hostInterface);
  void setReconciler(std::shared_ptr<Reconciler> reconciler);
  void setHostCommitAdapter(std::shared_ptr<HostCommitAdapter> hostCommitAdapter);

  [[nodiscard]] const std::shared_ptr<HostInterface>& hostInterface() const noexcept { return hostInterface_; }
  Reconciler& reconciler() { return *reconciler_; }
  HostCommitAdapter& hostCommitAdapter() { return *hostCommitAdapter_; }
  IdleWorkLoop& workLoop() { return workLoop_; }

  SchedulerPriority getCurrentPriorityLevel() const;

  // Runs `fn` with updates and batches stamped at `priority`; returns the previous level.
  SchedulerPriority runWithPriority(
    SchedulerPriority priority,
    const std::function<void()>& fn);

  [[nodiscard]] double now() const;

  ExpirationTime computeExpirationForUpdate() const;
  ExpirationTime computeBatchExpiration();
  BatchId nextBatchId() noexcept { return nextBatchId_++; }

private:
  std::shared_ptr<IdleCallbackHost> idleCallbackHost_;
  std::shared_ptr<HostInterface> hostInterface_;
  std::shared_ptr<Reconciler> reconciler_;
  std::shared_ptr<HostCommitAdapter> hostCommitAdapter_;
  IdleWorkLoop workLoop_;
  ExpirationClock expirationClock_{};
  SchedulerPriority currentPriority_{SchedulerPriority::NormalPriority};
  BatchId nextBatchId_{1};
};

} // namespace reactdom
