#include "ReactReconciler/ReactHostConfig.h"

#include "ReactDOM/client/ReactDOMComponent.h"
#include "ReactReconciler/ReactFiberHydrationContext.h"
#include "ReactRuntime/ReactHostInterface.h"
#include "shared/ReactErrors.h"
#include "shared/ReactGlobalError.h"

#include <cstddef>
#include <unordered_set>
#include <utility>

namespace reactdom {

namespace {

std::shared_ptr<ReactDOMComponent> asComponent(const hostconfig::HostInstance& instance) {
  return std::dynamic_pointer_cast<ReactDOMComponent>(instance);
}

} // namespace

ReactDOMHostCommitAdapter::ReactDOMHostCommitAdapter(std::shared_ptr<HostInterface> hostInterface)
    : hostInterface_(std::move(hostInterface)) {
  if (!hostInterface_) {
    hostInterface_ = std::make_shared<HostInterface>();
  }
}

void ReactDOMHostCommitAdapter::validateCommit(
    const hostconfig::HostContainer& container,
    const HostTree& nextTree) const {
  auto containerComponent = asComponent(container);
  if (!containerComponent || containerComponent->isTextInstance()) {
    throw HostCommitError("Target container is not a DOM element.");
  }

  std::unordered_set<const ReactDOMInstance*> seen;
  for (const auto& child : nextTree.children) {
    if (!hostInterface_->canAppendChild(container, child)) {
      throw HostCommitError(
        "Cannot commit " + (child ? child->debugDescription() : std::string("a null node")) +
        " into the container.");
    }
    if (!seen.insert(child.get()).second) {
      throw HostCommitError("The same node appears twice in a committed tree: " + child->debugDescription());
    }
  }
}

void ReactDOMHostCommitAdapter::apply(
    const hostconfig::HostContainer& container,
    const HostTree& currentTree,
    const HostTree& nextTree) {
  // Everything that can fail is checked before the container is touched.
  validateCommit(container, nextTree);
  auto containerComponent = asComponent(container);

  std::unordered_set<const ReactDOMInstance*> owned;
  for (const auto& child : currentTree.children) {
    owned.insert(child.get());
  }

  // Keep the root's nodes where they were relative to foreign children.
  auto& siblings = containerComponent->children;
  std::size_t position = siblings.size();
  for (std::size_t index = 0; index < siblings.size(); ++index) {
    if (owned.count(siblings[index].get()) != 0) {
      position = index;
      break;
    }
  }

  for (const auto& child : currentTree.children) {
    hostInterface_->removeHostChild(container, child);
  }

  const hostconfig::HostInstance anchor = position < siblings.size() ? siblings[position] : nullptr;
  for (const auto& child : nextTree.children) {
    hostInterface_->insertHostChildBefore(container, child, anchor);
  }
}

void ReactDOMHostCommitAdapter::hydrate(
    const hostconfig::HostContainer& container,
    HostTree& nextTree) {
  validateCommit(container, nextTree);
  auto containerComponent = asComponent(container);

  const std::vector<hostconfig::HostInstance> existing = containerComponent->children;
  const HydrationResult result =
    matchHydratableChildren(existing, nextTree.children, containerComponent->getType());
  if (result.matched) {
    nextTree.children = existing;
    return;
  }

  for (const auto& mismatch : result.mismatches) {
    reportWarning(mismatch);
  }

  // Mismatched markup is discarded and the client render replaces it.
  for (const auto& child : existing) {
    hostInterface_->removeHostChild(container, child);
  }
  for (const auto& child : nextTree.children) {
    hostInterface_->appendHostChild(container, child);
  }
}

} // namespace reactdom
