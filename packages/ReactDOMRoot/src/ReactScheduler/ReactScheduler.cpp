#include "ReactScheduler/ReactScheduler.h"

#include "shared/ReactGlobalError.h"

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <exception>
#include <iterator>
#include <utility>

namespace reactdom {

ReactScheduler::ReactScheduler()
  : baseTime_(std::chrono::steady_clock::now()) {
}

double ReactScheduler::FrameDeadline::timeRemaining() const {
  if (scheduler_.shouldYield()) {
    return 0.0;
  }
  return scheduler_.frameInterval_ - (scheduler_.now() - scheduler_.startTime_);
}

IdleCallbackToken ReactScheduler::requestIdleCallback(IdleCallback callback) {
  const std::uint64_t id = nextCallbackId_++;
  callbacks_.push_back(ScheduledCallback{id, std::move(callback)});
  isMessageLoopRunning_ = true;
  return IdleCallbackToken{id};
}

void ReactScheduler::cancelIdleCallback(IdleCallbackToken token) {
  if (!token) {
    return;
  }
  callbacks_.erase(
    std::remove_if(
      callbacks_.begin(),
      callbacks_.end(),
      [&token](const ScheduledCallback& entry) {
        return entry.id == token.id;
      }),
    callbacks_.end());
}

double ReactScheduler::now() const {
  const auto elapsed = std::chrono::steady_clock::now() - baseTime_;
  return std::chrono::duration<double, std::milli>(elapsed).count();
}

void ReactScheduler::forceFrameRate(double fps) {
  if (fps < 0.0 || fps > 125.0) {
    // Invalid frame rate, ignore
    return;
  }

  if (fps > 0.0) {
    frameInterval_ = 1000.0 / fps;
  } else {
    frameInterval_ = frameYieldMs;
  }
}

void ReactScheduler::requestPaint() {
  if (enableRequestPaint) {
    needsPaint_ = true;
  }
}

bool ReactScheduler::shouldYield() const {
  if (needsPaint_) {
    return true;
  }

  if (startTime_ < 0.0) {
    return false;
  }

  const double timeElapsed = now() - startTime_;
  return timeElapsed >= frameInterval_;
}

bool ReactScheduler::performWorkUntilDeadline() {
  if (!isMessageLoopRunning_) {
    return false;
  }

  needsPaint_ = false;
  startTime_ = now();

  // Callbacks requested while this frame runs belong to the next frame.
  std::vector<ScheduledCallback> frame;
  frame.swap(callbacks_);

  const FrameDeadline deadline(*this);
  for (std::size_t index = 0; index < frame.size(); ++index) {
    auto callback = std::move(frame[index].callback);
    try {
      callback(deadline);
    } catch (...) {
      // Unrun callbacks stay queued ahead of the ones requested during this frame.
      callbacks_.insert(
        callbacks_.begin(),
        std::make_move_iterator(frame.begin() + static_cast<std::ptrdiff_t>(index) + 1),
        std::make_move_iterator(frame.end()));
      startTime_ = -1.0;
      throw;
    }
  }

  startTime_ = -1.0;
  if (callbacks_.empty()) {
    isMessageLoopRunning_ = false;
    return false;
  }
  return true;
}

void ReactScheduler::runUntilIdle() {
  bool hasMoreWork = true;
  while (hasMoreWork) {
    try {
      hasMoreWork = performWorkUntilDeadline();
    } catch (const std::exception& ex) {
      // Like an uncaught error in a browser task: reported, and the loop goes on.
      reportGlobalError(ex);
      hasMoreWork = hasPendingCallbacks();
    }
  }
}

} // namespace reactdom
