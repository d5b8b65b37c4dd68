#include "ReactReconciler/ReactReconciler.h"

#include "ReactRuntime/ReactHostInterface.h"
#include "shared/ReactErrors.h"

#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

namespace reactdom {

namespace {

// Deeper trees are almost certainly a component that renders itself.
constexpr std::size_t kMaxRenderDepth = 1000;

} // namespace

ReactDOMReconciler::ReactDOMReconciler(std::shared_ptr<HostInterface> hostInterface)
    : hostInterface_(std::move(hostInterface)) {
  if (!hostInterface_) {
    hostInterface_ = std::make_shared<HostInterface>();
  }
}

HostTree ReactDOMReconciler::render(const HostTree& /*currentTree*/, const ReactNode& children) {
  HostTree next;
  reconcileChildren(next.children, children, 0);
  return next;
}

void ReactDOMReconciler::reconcileChildren(
    std::vector<hostconfig::HostInstance>& out,
    const ReactNode& node,
    std::size_t depth) {
  if (depth > kMaxRenderDepth) {
    throw std::runtime_error(
      "Maximum render depth exceeded. A component is probably rendering itself.");
  }

  switch (node.kind()) {
    case ReactNode::Kind::Empty:
      return;
    case ReactNode::Kind::Text:
      out.push_back(hostInterface_->createHostTextInstance(node.text()));
      return;
    case ReactNode::Kind::Fragment:
      for (const auto& child : node.fragment()) {
        reconcileChildren(out, child, depth + 1);
      }
      return;
    case ReactNode::Kind::Element:
      break;
  }

  const ReactElement& element = *node.element();
  if (!isValidElementType(element.type)) {
    throw InvalidElementTypeError(describeElementType(element.type));
  }

  if (const auto* component = std::get_if<ComponentTypePtr>(&element.type)) {
    const ReactNode rendered = (*component)->render(element.props, element.children);
    reconcileChildren(out, rendered, depth + 1);
    return;
  }

  out.push_back(createHostElement(element, depth));
}

hostconfig::HostInstance ReactDOMReconciler::createHostElement(
    const ReactElement& element,
    std::size_t depth) {
  const auto& type = std::get<std::string>(element.type);
  auto instance = hostInterface_->createHostInstance(type, element.props);
  if (element.key) {
    instance->setKey(*element.key);
  }

  std::vector<hostconfig::HostInstance> children;
  reconcileChildren(children, element.children, depth + 1);
  for (const auto& child : children) {
    hostInterface_->appendHostChild(instance, child);
  }
  return instance;
}

} // namespace reactdom
