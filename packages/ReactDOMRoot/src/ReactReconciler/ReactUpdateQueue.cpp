#include "ReactReconciler/ReactUpdateQueue.h"

#include <algorithm>
#include <utility>

namespace reactdom {

PendingUpdate* UpdateQueue::enqueue(std::unique_ptr<PendingUpdate> update) {
  if (!update) {
    return nullptr;
  }
  update->sortIndex = update->expirationTime;
  PendingUpdate* rawPtr = update.get();
  storage_.push_back(std::move(update));
  heap_.push(rawPtr);
  return rawPtr;
}

std::unique_ptr<PendingUpdate> UpdateQueue::remove(const PendingUpdate* update) {
  auto it = std::find_if(
    storage_.begin(),
    storage_.end(),
    [update](const std::unique_ptr<PendingUpdate>& entry) {
      return entry.get() == update;
    });
  if (it == storage_.end()) {
    return nullptr;
  }

  heap_.remove(update);
  std::unique_ptr<PendingUpdate> owned = std::move(*it);
  storage_.erase(it);
  return owned;
}

PendingUpdate* UpdateQueue::peekIf(const UpdatePredicate& predicate) const {
  return heap_.peekIf(predicate);
}

bool UpdateQueue::any(const UpdatePredicate& predicate) const {
  return heap_.any(predicate);
}

std::vector<PendingUpdate*> UpdateQueue::entries() const {
  return heap_.data();
}

} // namespace reactdom
