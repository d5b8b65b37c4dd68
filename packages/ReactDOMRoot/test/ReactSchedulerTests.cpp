#include "ReactDOM/client/ReactDOMRoot.h"
#include "ReactRuntime/ReactHostInterface.h"
#include "ReactRuntime/ReactRuntime.h"
#include "ReactScheduler/ReactScheduler.h"
#include "TestIdleHost.h"

#include <cassert>
#include <cmath>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace reactdom::test {

bool runReactSchedulerTests() {
  {
    ReactScheduler scheduler;
    assert(!scheduler.hasPendingCallbacks());
    assert(!scheduler.performWorkUntilDeadline());
    assert(scheduler.frameInterval() == frameYieldMs);

    std::vector<std::string> ops;
    const IdleCallbackToken first = scheduler.requestIdleCallback([&](const IdleDeadline& deadline) {
      ops.push_back("first");
      assert(deadline.timeRemaining() <= scheduler.frameInterval());
      assert(!deadline.didTimeout());
      // Requested during a frame: runs in the next one.
      scheduler.requestIdleCallback([&ops](const IdleDeadline&) { ops.push_back("nested"); });
    });
    const IdleCallbackToken cancelled = scheduler.requestIdleCallback([&ops](const IdleDeadline&) {
      ops.push_back("cancelled");
    });
    assert(first);
    assert(cancelled);
    assert(!(first == cancelled));

    scheduler.cancelIdleCallback(cancelled);
    scheduler.cancelIdleCallback(IdleCallbackToken{});
    assert(scheduler.hasPendingCallbacks());

    assert(scheduler.performWorkUntilDeadline());
    assert((ops == std::vector<std::string>{"first"}));
    assert(!scheduler.performWorkUntilDeadline());
    assert((ops == std::vector<std::string>{"first", "nested"}));
    assert(!scheduler.hasPendingCallbacks());
  }

  {
    ReactScheduler scheduler;
    scheduler.forceFrameRate(50.0);
    assert(scheduler.frameInterval() == 20.0);
    scheduler.forceFrameRate(500.0);
    assert(scheduler.frameInterval() == 20.0);
    scheduler.forceFrameRate(0.0);
    assert(scheduler.frameInterval() == frameYieldMs);

    bool sawPaintYield = false;
    scheduler.requestIdleCallback([&](const IdleDeadline& deadline) {
      scheduler.requestPaint();
      sawPaintYield = scheduler.shouldYield() && deadline.timeRemaining() == 0.0;
    });
    scheduler.runUntilIdle();
    assert(sawPaintYield);
  }

  {
    // A throwing callback leaves the rest of its frame queued.
    ReactScheduler scheduler;
    std::vector<std::string> ops;
    scheduler.requestIdleCallback([&ops](const IdleDeadline&) {
      ops.push_back("throws");
      throw std::runtime_error("idle callback failed");
    });
    scheduler.requestIdleCallback([&ops](const IdleDeadline&) { ops.push_back("after"); });

    bool threw = false;
    try {
      scheduler.performWorkUntilDeadline();
    } catch (const std::runtime_error&) {
      threw = true;
    }
    assert(threw);
    assert(scheduler.hasPendingCallbacks());
    assert(scheduler.performWorkUntilDeadline() == false);
    assert((ops == std::vector<std::string>{"throws", "after"}));
  }

  {
    // runUntilIdle reports escaped errors and keeps pumping.
    ScopedWarningCollector collector;
    ReactScheduler scheduler;
    std::vector<std::string> ops;
    scheduler.requestIdleCallback([](const IdleDeadline&) {
      throw std::runtime_error("boom");
    });
    scheduler.requestIdleCallback([&ops](const IdleDeadline&) { ops.push_back("still runs"); });
    scheduler.runUntilIdle();
    assert((collector.errors == std::vector<std::string>{"boom"}));
    assert((ops == std::vector<std::string>{"still runs"}));
  }

  {
    // The default host drives a root end to end.
    auto scheduler = std::make_shared<ReactScheduler>();
    auto runtime = std::make_shared<ReactRuntime>(scheduler);
    auto container = runtime->hostInterface()->createContainer();
    auto root = runtime->createRoot(container);

    bool committed = false;
    root->render(jsx::createElement("div", {}, "Hi"))->then([&committed]() { committed = true; });
    assert(scheduler->hasPendingCallbacks());
    assert(container->textContent().empty());

    scheduler->runUntilIdle();
    assert(committed);
    assert(container->textContent() == "Hi");
    assert(!scheduler->hasPendingCallbacks());
    assert(!runtime->workLoop().hasScheduledCallback());
  }

  return true;
}

} // namespace reactdom::test
