#pragma once

#include "ReactReconciler/ReactUpdateQueue.h"
#include "ReactReconciler/ReactWork.h"
#include "ReactRuntime/ReactJSXRuntime.h"
#include "ReactScheduler/ReactExpirationTime.h"

#include <functional>
#include <memory>
#include <vector>

namespace reactdom {

class ReactDOMRoot;

/**
 * An update scope that reaches the container only through commit().
 *
 * The idle loop may render a batch ahead of time; commit() then applies the
 * finished tree without rendering again, unless something else was committed
 * to the root in between.
 */
class ReactBatch {
public:
  using Callback = std::function<void()>;

  ReactBatch(std::weak_ptr<ReactDOMRoot> root, BatchId id, ExpirationTime expirationTime);

  ReactBatch(const ReactBatch&) = delete;
  ReactBatch& operator=(const ReactBatch&) = delete;

  std::shared_ptr<ReactWork> render(ReactNode children);
  void commit();

  // Runs once the batch's content is in the container.
  void then(ReactWork::Callback onCommit);

  // Runs once the batch has been rendered and is ready to commit.
  void onComplete(Callback onComplete);

  [[nodiscard]] BatchId id() const noexcept { return id_; }
  [[nodiscard]] ExpirationTime expirationTime() const noexcept { return expirationTime_; }
  [[nodiscard]] bool isCommitted() const noexcept { return committed_; }
  [[nodiscard]] bool didComplete() const noexcept { return didComplete_; }

private:
  friend class ReactDOMRoot;

  void markComplete();
  std::shared_ptr<ReactWork> markCommitted();

  std::shared_ptr<ReactDOMRoot> lockRoot(const char* operation) const;

  std::weak_ptr<ReactDOMRoot> root_;
  BatchId id_{NoBatch};
  ExpirationTime expirationTime_{NoWork};
  bool committed_{false};
  bool didComplete_{false};
  // Set by the first render(); only a batch that never had one may commit empty.
  bool hasRendered_{false};
  std::shared_ptr<ReactWork> work_;
  std::vector<Callback> completionCallbacks_;
};

} // namespace reactdom
