#include "ReactDOM/client/ReactDOMRoot.h"

#include "ReactDOM/client/ReactDOMBatch.h"
#include "ReactReconciler/ReactIdleWorkLoop.h"
#include "ReactReconciler/ReactReconciler.h"
#include "ReactRuntime/ReactRuntime.h"
#include "shared/ReactFeatureFlags.h"

#include <algorithm>
#include <exception>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace reactdom {

ReactDOMRoot::ReactDOMRoot(
  std::shared_ptr<ReactRuntime> runtime,
  hostconfig::HostContainer container,
  RootOptions options)
    : runtime_(std::move(runtime)),
      container_(std::move(container)),
      hydrate_(options.hydrate) {
  if (!runtime_) {
    throw std::invalid_argument("ReactDOMRoot requires a runtime");
  }
  if (!container_) {
    throw std::invalid_argument("ReactDOMRoot requires a container");
  }
}

ReactDOMRoot::~ReactDOMRoot() {
  runtime_->workLoop().unscheduleRoot(this);
}

std::shared_ptr<ReactWork> ReactDOMRoot::render(ReactNode children) {
  return scheduleUpdate(std::move(children), runtime_->computeExpirationForUpdate(), NoBatch, false);
}

std::shared_ptr<ReactWork> ReactDOMRoot::unmount() {
  return scheduleUpdate(ReactNode{}, runtime_->computeExpirationForUpdate(), NoBatch, true);
}

std::shared_ptr<ReactBatch> ReactDOMRoot::createBatch() {
  for (auto it = batches_.begin(); it != batches_.end();) {
    if (it->second.expired()) {
      it = batches_.erase(it);
    } else {
      ++it;
    }
  }

  const BatchId batchId = runtime_->nextBatchId();
  auto batch = std::make_shared<ReactBatch>(
    weak_from_this(),
    batchId,
    runtime_->computeBatchExpiration());
  batches_[batchId] = batch;
  return batch;
}

void ReactDOMRoot::flushSync() {
  runtime_->workLoop().flushSync(*this, [](const PendingUpdate& update) {
    return !update.isBatched();
  });
}

PendingUpdate* ReactDOMRoot::nextIdleUpdate() const {
  return queue_.peekIf([this](const PendingUpdate& update) {
    return isIdleEligible(update);
  });
}

PendingUpdate* ReactDOMRoot::nextUpdateMatching(const UpdatePredicate& predicate) const {
  return queue_.peekIf(predicate);
}

void ReactDOMRoot::performUnitOfWork(PendingUpdate& update, bool isSync) {
  if (!update.finishedTree || update.baseVersion != committedVersion_) {
    renderUpdate(update);
  }

  if (update.isBatched() && !isSync) {
    if (!enableBatchCompletionCallbacks) {
      return;
    }
    // Completion callbacks may render into or commit the batch, so `update`
    // is not touched past this point.
    if (auto batch = findBatch(update.batchId)) {
      batch->markComplete();
    }
    return;
  }

  commitUpdate(update);
}

std::shared_ptr<ReactWork> ReactDOMRoot::scheduleUpdate(
  ReactNode element,
  ExpirationTime expirationTime,
  BatchId batchId,
  bool isUnmount) {
  throwIfRendering(isUnmount ? "unmount" : "render");

  IdleWorkLoop& workLoop = runtime_->workLoop();

  auto update = std::make_unique<PendingUpdate>();
  update->id = workLoop.nextUpdateId();
  update->element = std::move(element);
  update->expirationTime = expirationTime;
  update->batchId = batchId;
  update->isUnmount = isUnmount;

  auto work = std::make_shared<ReactWork>(update->id);

  std::vector<std::unique_ptr<PendingUpdate>> superseded;
  for (PendingUpdate* queued : queue_.entries()) {
    const bool sameScope = queued->batchId == batchId && queued->expirationTime >= expirationTime;
    if (isUnmount || sameScope) {
      superseded.push_back(queue_.remove(queued));
    }
  }
  std::sort(
    superseded.begin(),
    superseded.end(),
    [](const std::unique_ptr<PendingUpdate>& a, const std::unique_ptr<PendingUpdate>& b) {
      return a->id < b->id;
    });
  for (auto& previous : superseded) {
    for (auto& previousWork : previous->works) {
      update->works.push_back(std::move(previousWork));
    }
  }
  update->works.push_back(work);

  queue_.enqueue(std::move(update));
  workLoop.scheduleRoot(shared_from_this());
  return work;
}

void ReactDOMRoot::flushBatch(BatchId batchId) {
  runtime_->workLoop().flushSync(*this, [batchId](const PendingUpdate& update) {
    return update.batchId == batchId;
  });
}

bool ReactDOMRoot::hasPendingBatchUpdate(BatchId batchId) const {
  return queue_.any([batchId](const PendingUpdate& update) {
    return update.batchId == batchId;
  });
}

bool ReactDOMRoot::isIdleEligible(const PendingUpdate& update) const {
  if (!update.isBatched()) {
    return true;
  }
  return !update.finishedTree || update.baseVersion != committedVersion_;
}

std::shared_ptr<ReactBatch> ReactDOMRoot::findBatch(BatchId batchId) const {
  auto it = batches_.find(batchId);
  if (it == batches_.end()) {
    return nullptr;
  }
  return it->second.lock();
}

void ReactDOMRoot::renderUpdate(PendingUpdate& update) {
  isRendering_ = true;
  try {
    HostTree finishedTree = runtime_->reconciler().render(currentTree_, update.element);
    isRendering_ = false;
    update.finishedTree = std::move(finishedTree);
    update.baseVersion = committedVersion_;
  } catch (...) {
    isRendering_ = false;
    // A rejected description is dropped; its works never resolve.
    queue_.remove(&update);
    throw;
  }
}

void ReactDOMRoot::commitUpdate(PendingUpdate& update) {
  std::unique_ptr<PendingUpdate> committed = queue_.remove(&update);
  if (!committed || !committed->finishedTree) {
    throw std::logic_error("commitUpdate requires a rendered update queued on this root");
  }

  HostTree nextTree = std::move(*committed->finishedTree);
  HostCommitAdapter& adapter = runtime_->hostCommitAdapter();
  if (isHydrating()) {
    adapter.hydrate(container_, nextTree);
    didHydrate_ = true;
  } else {
    adapter.apply(container_, currentTree_, nextTree);
  }
  currentTree_ = std::move(nextTree);
  ++committedVersion_;

  std::shared_ptr<ReactWork> batchWork;
  if (committed->isBatched()) {
    if (auto batch = findBatch(committed->batchId)) {
      batchWork = batch->markCommitted();
    }
  }

  std::exception_ptr firstError;
  for (auto& work : committed->works) {
    try {
      work->commit();
    } catch (...) {
      if (!firstError) {
        firstError = std::current_exception();
      }
    }
  }
  if (batchWork) {
    try {
      batchWork->commit();
    } catch (...) {
      if (!firstError) {
        firstError = std::current_exception();
      }
    }
  }
  if (firstError) {
    std::rethrow_exception(firstError);
  }
}

void ReactDOMRoot::throwIfRendering(const char* operation) const {
  if (isRendering_) {
    throw std::logic_error(
      std::string(operation) + " was called from inside a render step of the same root");
  }
}

} // namespace reactdom
