#include "ReactDOM/client/ReactDOMBatch.h"

#include "ReactDOM/client/ReactDOMRoot.h"

#include <exception>
#include <stdexcept>
#include <string>
#include <utility>

namespace reactdom {

ReactBatch::ReactBatch(std::weak_ptr<ReactDOMRoot> root, BatchId id, ExpirationTime expirationTime)
    : root_(std::move(root)),
      id_(id),
      expirationTime_(expirationTime),
      work_(std::make_shared<ReactWork>()) {}

std::shared_ptr<ReactWork> ReactBatch::render(ReactNode children) {
  std::shared_ptr<ReactDOMRoot> root = lockRoot("render");

  if (committed_) {
    committed_ = false;
    work_ = std::make_shared<ReactWork>();
  }
  didComplete_ = false;

  std::shared_ptr<ReactWork> work = root->scheduleUpdate(std::move(children), expirationTime_, id_, false);
  hasRendered_ = true;
  return work;
}

void ReactBatch::commit() {
  std::shared_ptr<ReactDOMRoot> root = lockRoot("commit");

  if (root->hasPendingBatchUpdate(id_)) {
    root->flushBatch(id_);
    return;
  }
  // A rendered update that failed or was superseded by unmount() never reached the container.
  if (committed_ || hasRendered_) {
    return;
  }

  // Nothing was rendered into this batch: nothing to apply, but it still counts as committed.
  markCommitted()->commit();
}

void ReactBatch::then(ReactWork::Callback onCommit) {
  work_->then(std::move(onCommit));
}

void ReactBatch::onComplete(Callback onComplete) {
  if (!onComplete) {
    return;
  }
  if (didComplete_) {
    onComplete();
    return;
  }
  completionCallbacks_.push_back(std::move(onComplete));
}

void ReactBatch::markComplete() {
  didComplete_ = true;

  std::vector<Callback> callbacks;
  callbacks.swap(completionCallbacks_);

  std::exception_ptr firstError;
  for (auto& callback : callbacks) {
    try {
      callback();
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

std::shared_ptr<ReactWork> ReactBatch::markCommitted() {
  committed_ = true;
  didComplete_ = true;

  // Committed without an idle render first; completion callbacks still run, with the work.
  for (auto& callback : completionCallbacks_) {
    work_->then(std::move(callback));
  }
  completionCallbacks_.clear();
  return work_;
}

std::shared_ptr<ReactDOMRoot> ReactBatch::lockRoot(const char* operation) const {
  std::shared_ptr<ReactDOMRoot> root = root_.lock();
  if (!root) {
    throw std::logic_error(
      std::string("ReactBatch::") + operation + " called after its root was destroyed");
  }
  return root;
}

} // namespace reactdom
