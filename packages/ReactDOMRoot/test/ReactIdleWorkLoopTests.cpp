#include "ReactDOM/client/ReactDOMRoot.h"
#include "ReactReconciler/ReactIdleWorkLoop.h"
#include "ReactRuntime/ReactHostInterface.h"
#include "ReactRuntime/ReactRuntime.h"
#include "shared/ReactErrors.h"
#include "TestIdleHost.h"

#include <cassert>
#include <limits>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace reactdom::test {

namespace {

struct LoopFixture {
  std::shared_ptr<TestIdleHost> host{std::make_shared<TestIdleHost>()};
  std::shared_ptr<ReactRuntime> runtime{std::make_shared<ReactRuntime>(host)};

  std::shared_ptr<ReactDOMComponent> createContainer() {
    return runtime->hostInterface()->createContainer();
  }
};

constexpr double kUnlimited = std::numeric_limits<double>::infinity();

void testZeroTimeHostStillProgresses() {
  LoopFixture fixture;
  auto containerA = fixture.createContainer();
  auto rootA = fixture.runtime->createRoot(containerA);
  auto containerB = fixture.createContainer();
  auto rootB = fixture.runtime->createRoot(containerB);
  auto containerC = fixture.createContainer();
  auto rootC = fixture.runtime->createRoot(containerC);

  rootA->render("a");
  rootB->render("b");
  rootC->render("c");
  assert(fixture.host->requestCount() == 1);
  assert(fixture.runtime->workLoop().hasScheduledCallback());

  assert(fixture.host->runSlice(0.0));
  assert(containerA->textContent() == "a");
  assert(containerB->textContent().empty());

  assert(fixture.host->runSlice(0.0));
  assert(containerB->textContent() == "b");
  assert(containerC->textContent().empty());

  assert(fixture.host->runSlice(0.0));
  assert(containerC->textContent() == "c");
  assert(!fixture.host->hasScheduledCallback());
  assert(!fixture.runtime->workLoop().hasScheduledCallback());
}

void testUnlimitedHostDrainsInOneSlice() {
  LoopFixture fixture;
  auto containerA = fixture.createContainer();
  auto rootA = fixture.runtime->createRoot(containerA);
  auto containerB = fixture.createContainer();
  auto rootB = fixture.runtime->createRoot(containerB);

  rootA->render("a");
  rootB->render("b");
  assert(fixture.host->runSlice(kUnlimited));
  assert(containerA->textContent() == "a");
  assert(containerB->textContent() == "b");
  assert(!fixture.host->hasScheduledCallback());
  assert(!fixture.host->runSlice(kUnlimited));
}

void testExpiredWorkIgnoresDeadline() {
  LoopFixture fixture;
  auto containerA = fixture.createContainer();
  auto rootA = fixture.runtime->createRoot(containerA);
  auto containerB = fixture.createContainer();
  auto rootB = fixture.runtime->createRoot(containerB);

  rootA->render("a");
  rootB->render("b");
  fixture.host->expire(6000);

  assert(fixture.host->runSlice(0.0));
  assert(containerA->textContent() == "a");
  assert(containerB->textContent() == "b");
  assert(!fixture.host->hasScheduledCallback());
}

void testMostUrgentUnitFirst() {
  LoopFixture fixture;
  auto containerA = fixture.createContainer();
  auto rootA = fixture.runtime->createRoot(containerA);
  auto containerB = fixture.createContainer();
  auto rootB = fixture.runtime->createRoot(containerB);

  rootA->render("a");
  fixture.runtime->runWithPriority(UserBlockingPriority, [&rootB]() { rootB->render("b"); });

  assert(fixture.host->runSlice(0.0));
  assert(containerB->textContent() == "b");
  assert(containerA->textContent().empty());
  assert(fixture.host->runSlice(0.0));
  assert(containerA->textContent() == "a");
}

void testErrorsPropagateAfterRescheduling() {
  LoopFixture fixture;
  auto containerA = fixture.createContainer();
  auto rootA = fixture.runtime->createRoot(containerA);
  auto containerB = fixture.createContainer();
  auto rootB = fixture.runtime->createRoot(containerB);

  ScopedWarningCollector collector;
  auto failed = rootA->render(jsx::createElement(ElementType{}));
  rootB->render("b");

  bool threw = false;
  try {
    fixture.host->flush();
  } catch (const InvalidElementTypeError&) {
    threw = true;
  }
  assert(threw);
  assert(!rootA->hasPendingWork());
  assert(!failed->isCommitted());
  assert(containerA->textContent().empty());

  // The loop asked for another slice before the error left it.
  assert(fixture.host->hasScheduledCallback());
  fixture.host->flush();
  assert(containerB->textContent() == "b");

  // The failed root is still usable.
  rootA->render("recovered");
  fixture.host->flush();
  assert(containerA->textContent() == "recovered");
}

void testFlushSyncCancelsIdleCallback() {
  LoopFixture fixture;
  auto container = fixture.createContainer();
  auto root = fixture.runtime->createRoot(container);

  root->render("now");
  assert(fixture.host->hasScheduledCallback());
  root->flushSync();
  assert(container->textContent() == "now");
  assert(!fixture.host->hasScheduledCallback());
  assert(!fixture.runtime->workLoop().hasIdleWork());

  // Flushing with nothing queued is harmless.
  root->flushSync();
  assert(container->textContent() == "now");
}

void testDroppedRootsAndRuntime() {
  auto host = std::make_shared<TestIdleHost>();
  {
    auto runtime = std::make_shared<ReactRuntime>(host);
    auto root = runtime->createRoot(runtime->hostInterface()->createContainer());
    root->render("unused");
    root.reset();

    // The loop never keeps a root alive; its slice finds nothing to do.
    assert(host->hasScheduledCallback());
    host->flush();
    assert(!host->hasScheduledCallback());
    assert(!runtime->workLoop().hasIdleWork());

    auto other = runtime->createRoot(runtime->hostInterface()->createContainer());
    other->render("pending");
    assert(host->hasScheduledCallback());
  }
  // Tearing down the runtime withdraws its request.
  assert(!host->hasScheduledCallback());
}

void testCallbacksMayScheduleMoreWork() {
  LoopFixture fixture;
  auto container = fixture.createContainer();
  auto root = fixture.runtime->createRoot(container);

  std::vector<std::string> ops;
  root->render("first")->then([&]() {
    ops.push_back(container->textContent());
    root->render("second")->then([&]() { ops.push_back(container->textContent()); });
  });

  assert(fixture.host->runSlice(kUnlimited));
  assert((ops == std::vector<std::string>{"first", "second"}));
  assert(container->textContent() == "second");
  assert(!fixture.host->hasScheduledCallback());
}

} // namespace

bool runReactIdleWorkLoopTests() {
  testZeroTimeHostStillProgresses();
  testUnlimitedHostDrainsInOneSlice();
  testExpiredWorkIgnoresDeadline();
  testMostUrgentUnitFirst();
  testErrorsPropagateAfterRescheduling();
  testFlushSyncCancelsIdleCallback();
  testDroppedRootsAndRuntime();
  testCallbacksMayScheduleMoreWork();
  return true;
}

} // namespace reactdom::test
