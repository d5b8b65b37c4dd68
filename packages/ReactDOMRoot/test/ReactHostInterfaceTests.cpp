#include "ReactDOM/client/ReactDOMComponent.h"
#include "ReactDOM/client/ReactDOMDiffProperties.h"
#include "ReactReconciler/ReactHostConfig.h"
#include "ReactReconciler/ReactReconciler.h"
#include "ReactRuntime/ReactHostInterface.h"
#include "ReactRuntime/ReactJSXRuntime.h"
#include "shared/ReactErrors.h"

#include <cassert>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace reactdom::test {

namespace {

std::shared_ptr<ReactDOMComponent> asComponent(const std::shared_ptr<ReactDOMInstance>& instance) {
  return std::dynamic_pointer_cast<ReactDOMComponent>(instance);
}

template <typename Fn>
bool throwsHostCommitError(Fn&& fn) {
  try {
    fn();
  } catch (const HostCommitError&) {
    return true;
  }
  return false;
}

void testHostInterface() {
  HostInterface hostInterface;

  auto container = hostInterface.createContainer();
  assert(container->getType() == "div");
  assert(!container->isTextInstance());
  assert(container->children.empty());

  auto span = hostInterface.createHostInstance("span", Props{{"className", std::string{"chip"}}});
  auto text = hostInterface.createHostTextInstance("Hello");
  assert(text->isTextInstance());
  assert(text->textContent() == "Hello");
  assert(text->debugDescription() == "#text{Hello}");

  hostInterface.appendHostChild(span, text);
  hostInterface.appendHostChild(container, span);
  assert(container->children.size() == 1);
  assert(span->getParent() == container);
  assert(text->getParent() == span);
  assert(container->textContent() == "Hello");
  assert(container->debugDescription() == "<div><span className=\"chip\">#text{Hello}</span></div>");

  auto first = hostInterface.createHostTextInstance("a");
  hostInterface.insertHostChildBefore(container, first, span);
  assert(container->textContent() == "aHello");
  auto last = hostInterface.createHostTextInstance("z");
  hostInterface.insertHostChildBefore(container, last, nullptr);
  assert(container->textContent() == "aHelloz");

  // Moving a node detaches it from its old parent.
  auto other = hostInterface.createContainer("section");
  hostInterface.appendHostChild(other, first);
  assert(container->textContent() == "Helloz");
  assert(other->textContent() == "a");
  assert(first->getParent() == other);

  hostInterface.removeHostChild(container, last);
  assert(container->textContent() == "Hello");
  assert(last->getParent() == nullptr);
  hostInterface.removeHostChild(container, nullptr);

  // No cycles, no children under text nodes.
  assert(!hostInterface.canAppendChild(span, container));
  assert(!hostInterface.canAppendChild(span, span));
  assert(!hostInterface.canAppendChild(text, first));
  assert(!hostInterface.canAppendChild(container, nullptr));
  assert(throwsHostCommitError([&]() { hostInterface.appendHostChild(span, container); }));
  assert(throwsHostCommitError([&]() { hostInterface.appendHostChild(text, first); }));
  assert(throwsHostCommitError([&]() { hostInterface.insertHostChildBefore(nullptr, first, nullptr); }));
  assert(container->children.size() == 1);
}

void testDiffProperties() {
  const Props prev{{"a", 1.0}, {"b", std::string{"x"}}, {"c", true}};
  const Props next{{"b", std::string{"y"}}, {"c", true}, {"d", 2.0}};
  const PropertyDiff diff = diffHostProperties(prev, next);
  assert((diff.removed == std::vector<std::string>{"a"}));
  assert((diff.changed == std::vector<std::string>{"b"}));
  assert((diff.added == std::vector<std::string>{"d"}));
  assert(!diff.empty());

  assert(diffHostProperties(prev, prev).empty());
  assert(diffHostProperties({}, {}).empty());

  // A number and a string that print the same still differ.
  const PropertyDiff typed = diffHostProperties(Props{{"v", 1.0}}, Props{{"v", std::string{"1"}}});
  assert((typed.changed == std::vector<std::string>{"v"}));
}

void testReconciler() {
  auto hostInterface = std::make_shared<HostInterface>();
  ReactDOMReconciler reconciler(hostInterface);

  auto label = jsx::component("Label", [](const Props& props, const ReactNode&) {
    return ReactNode{jsx::createElement("b", {}, std::get<std::string>(props.at("text")))};
  });

  const HostTree tree = reconciler.render(
    HostTree{},
    std::vector<ReactNode>{
      jsx::jsxs("div", Props{{"id", std::string{"x"}}}, {jsx::createElement("span", {}, "a"), "b"}, std::string{"k"}),
      jsx::createElement(label, Props{{"text", std::string{"c"}}}),
      nullptr,
      7,
    });
  assert(tree.children.size() == 3);
  auto div = asComponent(tree.children[0]);
  assert(div->getType() == "div");
  assert(div->getKey() == "k");
  assert(div->textContent() == "ab");
  assert(div->getParent() == nullptr);
  assert(asComponent(tree.children[1])->getType() == "b");
  assert(tree.children[2]->textContent() == "7");

  assert(reconciler.render(HostTree{}, ReactNode{}).empty());

  bool threwInvalidType = false;
  try {
    reconciler.render(HostTree{}, jsx::createElement("div", {}, ReactNode{std::make_shared<ReactElement>()}));
  } catch (const InvalidElementTypeError& error) {
    threwInvalidType = std::string(error.what()).rfind("Element type is invalid", 0) == 0;
  }
  assert(threwInvalidType);

  auto holder = std::make_shared<ComponentTypePtr>();
  std::weak_ptr<ComponentTypePtr> weakHolder = holder;
  *holder = jsx::component("Loop", [weakHolder](const Props&, const ReactNode&) {
    return ReactNode{jsx::createElement(*weakHolder.lock())};
  });
  bool threwDepth = false;
  try {
    reconciler.render(HostTree{}, jsx::createElement(*holder));
  } catch (const std::runtime_error& error) {
    threwDepth = std::string(error.what()).find("Maximum render depth") != std::string::npos;
  }
  assert(threwDepth);
}

void testCommitAdapter() {
  auto hostInterface = std::make_shared<HostInterface>();
  ReactDOMHostCommitAdapter adapter(hostInterface);
  ReactDOMReconciler reconciler(hostInterface);

  auto container = hostInterface->createContainer();
  hostInterface->appendHostChild(container, hostInterface->createHostTextInstance("a"));

  const HostTree first = reconciler.render(HostTree{}, std::vector<ReactNode>{"b", "c"});
  adapter.apply(container, HostTree{}, first);
  assert(container->textContent() == "abc");

  // Foreign children around the root's nodes stay where they are.
  hostInterface->appendHostChild(container, hostInterface->createHostTextInstance("z"));
  assert(container->textContent() == "abcz");
  const HostTree second = reconciler.render(first, std::vector<ReactNode>{"d"});
  adapter.apply(container, first, second);
  assert(container->textContent() == "adz");
  assert(first.children[0]->getParent() == nullptr);

  adapter.apply(container, second, HostTree{});
  assert(container->textContent() == "az");

  // Rejected commits leave the container untouched.
  const HostTree third = reconciler.render(HostTree{}, "e");
  auto textContainer = hostInterface->createHostTextInstance("t");
  assert(throwsHostCommitError([&]() { adapter.apply(textContainer, HostTree{}, third); }));

  HostTree duplicated;
  duplicated.children = {third.children[0], third.children[0]};
  assert(throwsHostCommitError([&]() { adapter.apply(container, HostTree{}, duplicated); }));

  HostTree ancestor;
  ancestor.children = {container};
  assert(throwsHostCommitError([&]() { adapter.apply(container, HostTree{}, ancestor); }));
  assert(container->textContent() == "az");
}

} // namespace

bool runReactHostInterfaceTests() {
  testHostInterface();
  testDiffProperties();
  testReconciler();
  testCommitAdapter();
  return true;
}

} // namespace reactdom::test
