#pragma once

#include "ReactReconciler/ReactHostConfig.h"
#include "ReactReconciler/ReactUpdateQueue.h"
#include "ReactReconciler/ReactWork.h"
#include "ReactRuntime/ReactJSXRuntime.h"

#include <cstdint>
#include <map>
#include <memory>

namespace reactdom {

class ReactBatch;
class ReactRuntime;

struct RootOptions {
  // Adopt the container's existing markup on the first commit when it matches.
  bool hydrate{false};
};

/**
 * A container plus the queue of updates headed for it.
 *
 * render() and unmount() go through the idle loop; batches created here are
 * committed only when the caller asks. The container is touched only by the
 * runtime's HostCommitAdapter.
 */
class ReactDOMRoot : public std::enable_shared_from_this<ReactDOMRoot> {
public:
  ReactDOMRoot(
    std::shared_ptr<ReactRuntime> runtime,
    hostconfig::HostContainer container,
    RootOptions options = {});
  ~ReactDOMRoot();

  ReactDOMRoot(const ReactDOMRoot&) = delete;
  ReactDOMRoot& operator=(const ReactDOMRoot&) = delete;

  std::shared_ptr<ReactWork> render(ReactNode children);
  std::shared_ptr<ReactWork> unmount();
  std::shared_ptr<ReactBatch> createBatch();

  // Commits every unbatched update of this root now.
  void flushSync();

  [[nodiscard]] const hostconfig::HostContainer& container() const noexcept { return container_; }
  [[nodiscard]] const HostTree& currentTree() const noexcept { return currentTree_; }
  [[nodiscard]] bool isHydrating() const noexcept { return hydrate_ && !didHydrate_; }
  [[nodiscard]] bool hasPendingWork() const noexcept { return !queue_.empty(); }
  [[nodiscard]] std::uint64_t committedVersion() const noexcept { return committedVersion_; }

  // Work loop interface.
  [[nodiscard]] PendingUpdate* nextIdleUpdate() const;
  [[nodiscard]] PendingUpdate* nextUpdateMatching(const UpdatePredicate& predicate) const;
  [[nodiscard]] bool isRendering() const noexcept { return isRendering_; }
  void performUnitOfWork(PendingUpdate& update, bool isSync);

private:
  friend class ReactBatch;

  std::shared_ptr<ReactWork> scheduleUpdate(
    ReactNode element,
    ExpirationTime expirationTime,
    BatchId batchId,
    bool isUnmount);

  void flushBatch(BatchId batchId);
  [[nodiscard]] bool hasPendingBatchUpdate(BatchId batchId) const;

  [[nodiscard]] bool isIdleEligible(const PendingUpdate& update) const;
  [[nodiscard]] std::shared_ptr<ReactBatch> findBatch(BatchId batchId) const;

  void renderUpdate(PendingUpdate& update);
  void commitUpdate(PendingUpdate& update);
  void throwIfRendering(const char* operation) const;

  std::shared_ptr<ReactRuntime> runtime_;
  hostconfig::HostContainer container_;
  HostTree currentTree_{};
  UpdateQueue queue_{};

  bool hydrate_{false};
  bool didHydrate_{false};
  bool isRendering_{false};

  // Bumped on every commit; finished trees rendered against an older version are stale.
  std::uint64_t committedVersion_{0};

  std::map<BatchId, std::weak_ptr<ReactBatch>> batches_{};
};

} // namespace reactdom
