#pragma once

#include "ReactReconciler/ReactHostConfig.h"
#include "ReactRuntime/ReactJSXRuntime.h"

#include <cstddef>
#include <memory>
#include <vector>

namespace reactdom {

class HostInterface;

// The render step: turns a description into the host nodes a root should
// contain. Must not touch the container. Throws to reject the description.
class Reconciler {
public:
  virtual ~Reconciler() = default;

  virtual HostTree render(const HostTree& currentTree, const ReactNode& children) = 0;
};

// Builds a detached host tree from scratch on every render.
class ReactDOMReconciler : public Reconciler {
public:
  explicit ReactDOMReconciler(std::shared_ptr<HostInterface> hostInterface);

  HostTree render(const HostTree& currentTree, const ReactNode& children) override;

private:
  void reconcileChildren(
    std::vector<hostconfig::HostInstance>& out,
    const ReactNode& node,
    std::size_t depth);

  hostconfig::HostInstance createHostElement(const ReactElement& element, std::size_t depth);

  std::shared_ptr<HostInterface> hostInterface_;
};

} // namespace reactdom
