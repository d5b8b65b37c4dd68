#include "ReactRuntime/ReactHostInterface.h"

#include "shared/ReactErrors.h"

#include <algorithm>

namespace reactdom {

namespace {

std::shared_ptr<ReactDOMComponent> asComponent(const std::shared_ptr<ReactDOMInstance>& instance) {
  return std::dynamic_pointer_cast<ReactDOMComponent>(instance);
}

std::shared_ptr<ReactDOMComponent> requireParentComponent(
    const std::shared_ptr<ReactDOMInstance>& parent) {
  auto parentComponent = asComponent(parent);
  if (!parentComponent) {
    throw HostCommitError("Target container is not a host component.");
  }
  if (parentComponent->isTextInstance()) {
    throw HostCommitError("Cannot append children to a text node: " + parentComponent->debugDescription());
  }
  return parentComponent;
}

} // namespace

std::shared_ptr<ReactDOMInstance> HostInterface::createHostInstance(
    const std::string& type,
    const Props& props) {
  return std::make_shared<ReactDOMComponent>(type, props);
}

std::shared_ptr<ReactDOMInstance> HostInterface::createHostTextInstance(const std::string& text) {
  return std::make_shared<ReactDOMComponent>("#text", Props{}, true, text);
}

std::shared_ptr<ReactDOMComponent> HostInterface::createContainer(const std::string& type) {
  return std::make_shared<ReactDOMComponent>(type);
}

bool HostInterface::canAppendChild(
    const std::shared_ptr<ReactDOMInstance>& parent,
    const std::shared_ptr<ReactDOMInstance>& child) const {
  auto parentComponent = asComponent(parent);
  if (!parentComponent || parentComponent->isTextInstance() || !child) {
    return false;
  }
  // A node may not become its own ancestor.
  for (auto ancestor = parent; ancestor; ancestor = ancestor->getParent()) {
    if (ancestor.get() == child.get()) {
      return false;
    }
  }
  return true;
}

void HostInterface::detachFromParent(const std::shared_ptr<ReactDOMInstance>& child) {
  if (!child) {
    return;
  }
  auto currentParent = child->getParent();
  if (!currentParent) {
    return;
  }
  auto parentComponent = asComponent(currentParent);
  if (!parentComponent) {
    return;
  }
  auto& siblings = parentComponent->children;
  siblings.erase(
      std::remove_if(
          siblings.begin(),
          siblings.end(),
          [&](const std::shared_ptr<ReactDOMInstance>& candidate) {
            return candidate.get() == child.get();
          }),
      siblings.end());
  child->clearParent();
}

void HostInterface::appendHostChild(
    const std::shared_ptr<ReactDOMInstance>& parent,
    const std::shared_ptr<ReactDOMInstance>& child) {
  auto parentComponent = requireParentComponent(parent);
  if (!canAppendChild(parent, child)) {
    throw HostCommitError("Cannot append " + (child ? child->debugDescription() : std::string("null")) +
      " to " + parentComponent->debugDescription() + ".");
  }

  detachFromParent(child);
  parentComponent->children.push_back(child);
  child->setParent(parent);
}

void HostInterface::insertHostChildBefore(
    const std::shared_ptr<ReactDOMInstance>& parent,
    const std::shared_ptr<ReactDOMInstance>& child,
    const std::shared_ptr<ReactDOMInstance>& beforeChild) {
  auto parentComponent = requireParentComponent(parent);
  if (!canAppendChild(parent, child)) {
    throw HostCommitError("Cannot insert " + (child ? child->debugDescription() : std::string("null")) +
      " into " + parentComponent->debugDescription() + ".");
  }

  detachFromParent(child);

  auto& siblings = parentComponent->children;
  auto it = std::find_if(
      siblings.begin(),
      siblings.end(),
      [&](const std::shared_ptr<ReactDOMInstance>& candidate) {
        return beforeChild && candidate.get() == beforeChild.get();
      });

  siblings.insert(it, child);
  child->setParent(parent);
}

void HostInterface::removeHostChild(
    const std::shared_ptr<ReactDOMInstance>& parent,
    const std::shared_ptr<ReactDOMInstance>& child) {
  auto parentComponent = asComponent(parent);
  if (!parentComponent || !child) {
    return;
  }
  auto& siblings = parentComponent->children;
  siblings.erase(
      std::remove_if(
          siblings.begin(),
          siblings.end(),
          [&](const std::shared_ptr<ReactDOMInstance>& candidate) {
            return candidate.get() == child.get();
          }),
      siblings.end());
  child->clearParent();
}

} // namespace reactdom
