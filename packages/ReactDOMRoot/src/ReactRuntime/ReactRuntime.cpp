#include "ReactRuntime/ReactRuntime.h"

#include "ReactRuntime/ReactHostInterface.h"

#include <stdexcept>
#include <utility>

namespace reactdom {

ReactRuntime::ReactRuntime(std::shared_ptr<IdleCallbackHost> idleCallbackHost)
    : idleCallbackHost_(std::move(idleCallbackHost)),
      workLoop_(idleCallbackHost_) {
  setHostInterface(std::make_shared<HostInterface>());
}

std::shared_ptr<ReactDOMRoot> ReactRuntime::createRoot(
  hostconfig::HostContainer container,
  RootOptions options) {
  return std::make_shared<ReactDOMRoot>(shared_from_this(), std::move(container), options);
}

void ReactRuntime::setHostInterface(std::shared_ptr<HostInterface> hostInterface) {
  if (!hostInterface) {
    throw std::invalid_argument("ReactRuntime::setHostInterface requires a host interface");
  }
  hostInterface_ = std::move(hostInterface);
  reconciler_ = std::make_shared<ReactDOMReconciler>(hostInterface_);
  hostCommitAdapter_ = std::make_shared<ReactDOMHostCommitAdapter>(hostInterface_);
}

void ReactRuntime::setReconciler(std::shared_ptr<Reconciler> reconciler) {
  if (!reconciler) {
    throw std::invalid_argument("ReactRuntime::setReconciler requires a reconciler");
  }
  reconciler_ = std::move(reconciler);
}

void ReactRuntime::setHostCommitAdapter(std::shared_ptr<HostCommitAdapter> hostCommitAdapter) {
  if (!hostCommitAdapter) {
    throw std::invalid_argument("ReactRuntime::setHostCommitAdapter requires an adapter");
  }
  hostCommitAdapter_ = std::move(hostCommitAdapter);
}

SchedulerPriority ReactRuntime::getCurrentPriorityLevel() const {
  return currentPriority_;
}

SchedulerPriority ReactRuntime::runWithPriority(
  SchedulerPriority priority,
  const std::function<void()>& fn) {
  if (!isValidPriority(priority) || priority == SchedulerPriority::NoPriority) {
    priority = SchedulerPriority::NormalPriority;
  }

  const SchedulerPriority previousPriority = currentPriority_;
  currentPriority_ = priority;

  try {
    fn();
  } catch (...) {
    currentPriority_ = previousPriority;
    throw;
  }

  currentPriority_ = previousPriority;
  return previousPriority;
}

double ReactRuntime::now() const {
  return idleCallbackHost_->now();
}

ExpirationTime ReactRuntime::computeExpirationForUpdate() const {
  return computeExpiration(now(), currentPriority_);
}

ExpirationTime ReactRuntime::computeBatchExpiration() {
  return expirationClock_.computeUniqueExpiration(now(), currentPriority_);
}

} // namespace reactdom
