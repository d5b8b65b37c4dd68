#pragma once

#include <cstdint>
#include <functional>
#include <vector>

namespace reactdom {

/**
 * Thenable returned by every render call.
 *
 * Pending until the root's host adapter has applied the update it tracks,
 * then Committed for good. Callbacks registered while Pending run once, in
 * registration order, at that transition; callbacks registered afterwards
 * run before then() returns.
 */
class ReactWork {
public:
  using Callback = std::function<void()>;

  enum class State : std::uint8_t {
    Pending,
    Committed,
  };

  explicit ReactWork(std::uint64_t targetUpdateId = 0);

  ReactWork(const ReactWork&) = delete;
  ReactWork& operator=(const ReactWork&) = delete;

  void then(Callback onCommit);

  // Runs every queued callback even if one throws; the first exception is rethrown after.
  void commit();

  [[nodiscard]] State state() const noexcept { return state_; }
  [[nodiscard]] bool isCommitted() const noexcept { return state_ == State::Committed; }
  [[nodiscard]] std::uint64_t targetUpdateId() const noexcept { return targetUpdateId_; }

private:
  std::uint64_t targetUpdateId_{0};
  State state_{State::Pending};
  std::vector<Callback> callbacks_;
};

} // namespace reactdom
