#pragma once

#include "ReactDOM/client/ReactDOMComponent.h"

#include <memory>
#include <string>

namespace reactdom {

// Imperative mutation primitives over the in-memory host tree.
class HostInterface {
public:
  HostInterface() = default;
  virtual ~HostInterface() = default;

  virtual std::shared_ptr<ReactDOMInstance> createHostInstance(
      const std::string& type,
      const Props& props);

  virtual std::shared_ptr<ReactDOMInstance> createHostTextInstance(const std::string& text);

  // Creates the node a root renders into.
  std::shared_ptr<ReactDOMComponent> createContainer(const std::string& type = "div");

  void appendHostChild(
      const std::shared_ptr<ReactDOMInstance>& parent,
      const std::shared_ptr<ReactDOMInstance>& child);

  void insertHostChildBefore(
      const std::shared_ptr<ReactDOMInstance>& parent,
      const std::shared_ptr<ReactDOMInstance>& child,
      const std::shared_ptr<ReactDOMInstance>& beforeChild);

  void removeHostChild(
      const std::shared_ptr<ReactDOMInstance>& parent,
      const std::shared_ptr<ReactDOMInstance>& child);

  // Whether `child` may be attached under `parent` without throwing.
  [[nodiscard]] bool canAppendChild(
      const std::shared_ptr<ReactDOMInstance>& parent,
      const std::shared_ptr<ReactDOMInstance>& child) const;

private:
  void detachFromParent(const std::shared_ptr<ReactDOMInstance>& child);
};

} // namespace reactdom
