#pragma once

#include "ReactScheduler/IdleCallbackHost.h"
#include "ReactScheduler/SchedulerFeatureFlags.h"

#include <chrono>
#include <cstdint>
#include <vector>

namespace reactdom {

/**
 * Default idle-callback host
 *
 * Follows the browser message-loop model:
 * - Callbacks queue up until the embedder pumps the loop
 * - Each pump is one frame; every callback in it shares the frame budget
 * - The budget is frameYieldMs, or 1000 / fps after forceFrameRate
 * - requestPaint() ends the current frame early
 */
class ReactScheduler : public IdleCallbackHost {
private:
  struct ScheduledCallback {
    std::uint64_t id{0};
    IdleCallback callback;
  };

  class FrameDeadline final : public IdleDeadline {
  public:
    explicit FrameDeadline(const ReactScheduler& scheduler) : scheduler_(scheduler) {}

    double timeRemaining() const override;

  private:
    const ReactScheduler& scheduler_;
  };

  std::vector<ScheduledCallback> callbacks_;
  std::uint64_t nextCallbackId_{1};

  bool isMessageLoopRunning_{false};
  bool needsPaint_{false};

  double frameInterval_{frameYieldMs};
  double startTime_{-1.0};
  std::chrono::steady_clock::time_point baseTime_;

public:
  ReactScheduler();
  ~ReactScheduler() override = default;

  IdleCallbackToken requestIdleCallback(IdleCallback callback) override;
  void cancelIdleCallback(IdleCallbackToken token) override;
  double now() const override;

  void forceFrameRate(double fps);
  void requestPaint();
  [[nodiscard]] bool shouldYield() const;
  [[nodiscard]] double frameInterval() const noexcept { return frameInterval_; }

  [[nodiscard]] bool hasPendingCallbacks() const noexcept { return !callbacks_.empty(); }

  // Runs one frame. Returns whether callbacks are still queued afterwards.
  bool performWorkUntilDeadline();

  // Pumps frames until no callback is queued. Exceptions escaping a frame go to reportGlobalError.
  void runUntilIdle();
};

} // namespace reactdom
