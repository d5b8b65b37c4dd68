#pragma once

#include "ReactReconciler/ReactHostConfig.h"
#include "ReactReconciler/ReactWork.h"
#include "ReactRuntime/ReactJSXRuntime.h"
#include "ReactScheduler/ReactExpirationTime.h"
#include "ReactScheduler/SchedulerMinHeap.h"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <vector>

namespace reactdom {

using BatchId = std::uint64_t;

inline constexpr BatchId NoBatch = 0;

// One render request waiting to reach the container. HeapNode::id is the
// insertion order, HeapNode::sortIndex mirrors expirationTime.
struct PendingUpdate : public HeapNode {
  ReactNode element;
  ExpirationTime expirationTime{NoWork};
  BatchId batchId{NoBatch};
  bool isUnmount{false};

  // Result of the render step, and the root version it was computed against.
  std::optional<HostTree> finishedTree;
  std::uint64_t baseVersion{0};

  // Works of this update and of every update it superseded, oldest first.
  std::vector<std::shared_ptr<ReactWork>> works;

  [[nodiscard]] bool isBatched() const noexcept { return batchId != NoBatch; }
};

using UpdatePredicate = std::function<bool(const PendingUpdate&)>;

class UpdateQueue {
public:
  PendingUpdate* enqueue(std::unique_ptr<PendingUpdate> update);

  // Takes the update out of the queue and hands back ownership.
  std::unique_ptr<PendingUpdate> remove(const PendingUpdate* update);

  [[nodiscard]] PendingUpdate* peekIf(const UpdatePredicate& predicate) const;
  [[nodiscard]] bool any(const UpdatePredicate& predicate) const;

  // Snapshot in no particular order; safe to mutate the queue while iterating it.
  [[nodiscard]] std::vector<PendingUpdate*> entries() const;

  [[nodiscard]] bool empty() const noexcept { return heap_.empty(); }
  [[nodiscard]] std::size_t size() const noexcept { return heap_.size(); }

private:
  SchedulerMinHeap<PendingUpdate> heap_;
  std::vector<std::unique_ptr<PendingUpdate>> storage_;
};

} // namespace reactdom
