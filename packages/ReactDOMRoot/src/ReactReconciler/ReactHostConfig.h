#pragma once

#include "ReactDOM/client/ReactDOMInstance.h"

#include <memory>
#include <vector>

namespace reactdom {

class HostInterface;

namespace hostconfig {

using HostInstance = std::shared_ptr<ReactDOMInstance>;
using HostContainer = std::shared_ptr<ReactDOMInstance>;

} // namespace hostconfig

// The nodes a root has rendered into its container, in order.
struct HostTree {
  std::vector<hostconfig::HostInstance> children;

  [[nodiscard]] bool empty() const noexcept { return children.empty(); }
};

/**
 * The only code allowed to mutate a root's container.
 *
 * apply() replaces the nodes of `currentTree` with those of `nextTree`.
 * hydrate() is used instead of apply() for the first commit of a hydrating
 * root; it may replace the nodes in `nextTree` with the container's
 * existing ones when they match.
 * Both throw HostCommitError to reject a commit.
 */
class HostCommitAdapter {
public:
  virtual ~HostCommitAdapter() = default;

  virtual void apply(
    const hostconfig::HostContainer& container,
    const HostTree& currentTree,
    const HostTree& nextTree) = 0;

  virtual void hydrate(
    const hostconfig::HostContainer& container,
    HostTree& nextTree) = 0;
};

class ReactDOMHostCommitAdapter : public HostCommitAdapter {
public:
  explicit ReactDOMHostCommitAdapter(std::shared_ptr<HostInterface> hostInterface);

  void apply(
    const hostconfig::HostContainer& container,
    const HostTree& currentTree,
    const HostTree& nextTree) override;

  void hydrate(
    const hostconfig::HostContainer& container,
    HostTree& nextTree) override;

private:
  void validateCommit(const hostconfig::HostContainer& container, const HostTree& nextTree) const;

  std::shared_ptr<HostInterface> hostInterface_;
};

} // namespace reactdom
