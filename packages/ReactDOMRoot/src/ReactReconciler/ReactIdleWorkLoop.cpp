#include "ReactReconciler/ReactIdleWorkLoop.h"

#include "ReactDOM/client/ReactDOMRoot.h"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace reactdom {

IdleWorkLoop::IdleWorkLoop(std::shared_ptr<IdleCallbackHost> host)
    : host_(std::move(host)) {
  if (!host_) {
    throw std::invalid_argument("IdleWorkLoop requires an idle callback host");
  }
}

IdleWorkLoop::~IdleWorkLoop() {
  cancelCallback();
}

void IdleWorkLoop::scheduleRoot(const std::shared_ptr<ReactDOMRoot>& root) {
  if (!root) {
    return;
  }

  const bool alreadyScheduled = std::any_of(
    scheduledRoots_.begin(),
    scheduledRoots_.end(),
    [&root](const std::weak_ptr<ReactDOMRoot>& entry) {
      return entry.lock() == root;
    });
  if (!alreadyScheduled) {
    scheduledRoots_.push_back(root);
  }

  scheduleCallback();
}

void IdleWorkLoop::unscheduleRoot(const ReactDOMRoot* root) {
  scheduledRoots_.erase(
    std::remove_if(
      scheduledRoots_.begin(),
      scheduledRoots_.end(),
      [root](const std::weak_ptr<ReactDOMRoot>& entry) {
        auto locked = entry.lock();
        return !locked || locked.get() == root;
      }),
    scheduledRoots_.end());
}

void IdleWorkLoop::scheduleCallback() {
  if (callbackToken_) {
    return;
  }

  const std::uint64_t generation = ++callbackGeneration_;
  callbackToken_ = host_->requestIdleCallback([this, generation](const IdleDeadline& deadline) {
    // A cancelled request that the host still delivers is ignored.
    if (generation != callbackGeneration_) {
      return;
    }
    onIdleSlice(deadline);
  });
}

void IdleWorkLoop::cancelCallback() {
  if (!callbackToken_) {
    return;
  }
  host_->cancelIdleCallback(callbackToken_);
  callbackToken_ = {};
  ++callbackGeneration_;
}

void IdleWorkLoop::settleCallback() {
  if (hasIdleWork()) {
    scheduleCallback();
  } else {
    cancelCallback();
  }
}

void IdleWorkLoop::onIdleSlice(const IdleDeadline& deadline) {
  // The request that delivered this slice is spent.
  callbackToken_ = {};
  ++callbackGeneration_;

  bool didPerformUnit = false;
  try {
    while (true) {
      WorkUnit unit = findNextUnit();
      if (unit.second == nullptr) {
        break;
      }
      if (didPerformUnit && deadline.timeRemaining() <= 0 && !isExpired(*unit.second)) {
        break;
      }
      unit.first->performUnitOfWork(*unit.second, false);
      didPerformUnit = true;
    }
  } catch (...) {
    settleCallback();
    throw;
  }

  settleCallback();
}

void IdleWorkLoop::flushSync(ReactDOMRoot& root, const UpdatePredicate& predicate) {
  if (root.isRendering()) {
    throw std::logic_error("flushSync was called from inside a render step of the same root");
  }

  try {
    while (PendingUpdate* update = root.nextUpdateMatching(predicate)) {
      root.performUnitOfWork(*update, true);
    }
  } catch (...) {
    settleCallback();
    throw;
  }

  settleCallback();
}

bool IdleWorkLoop::hasIdleWork() {
  return findNextUnit().second != nullptr;
}

double IdleWorkLoop::now() const {
  return host_->now();
}

IdleWorkLoop::WorkUnit IdleWorkLoop::findNextUnit() {
  WorkUnit best{nullptr, nullptr};

  auto it = scheduledRoots_.begin();
  while (it != scheduledRoots_.end()) {
    std::shared_ptr<ReactDOMRoot> root = it->lock();
    if (!root || !root->hasPendingWork()) {
      it = scheduledRoots_.erase(it);
      continue;
    }
    ++it;

    PendingUpdate* candidate = root->nextIdleUpdate();
    if (candidate == nullptr) {
      continue;
    }
    if (best.second == nullptr ||
        candidate->sortIndex < best.second->sortIndex ||
        (candidate->sortIndex == best.second->sortIndex && candidate->id < best.second->id)) {
      best = WorkUnit{std::move(root), candidate};
    }
  }

  return best;
}

bool IdleWorkLoop::isExpired(const PendingUpdate& update) const {
  return update.expirationTime <= msToExpirationTime(host_->now());
}

} // namespace reactdom
