#include <cstdlib>

namespace reactdom::test {
bool runReactExpirationTimeTests();
bool runSchedulerMinHeapTests();
bool runReactWorkTests();
bool runReactSchedulerTests();
bool runReactJSXRuntimeTests();
bool runReactHostInterfaceTests();
bool runReactHydrationTests();
bool runReactIdleWorkLoopTests();
bool runReactDOMRootTests();
bool runReactDOMBatchTests();
}

int main() {
    bool allPassed = true;
    allPassed &= reactdom::test::runReactExpirationTimeTests();
    allPassed &= reactdom::test::runSchedulerMinHeapTests();
    allPassed &= reactdom::test::runReactWorkTests();
    allPassed &= reactdom::test::runReactSchedulerTests();
    allPassed &= reactdom::test::runReactJSXRuntimeTests();
    allPassed &= reactdom::test::runReactHostInterfaceTests();
    allPassed &= reactdom::test::runReactHydrationTests();
    allPassed &= reactdom::test::runReactIdleWorkLoopTests();
    allPassed &= reactdom::test::runReactDOMRootTests();
    allPassed &= reactdom::test::runReactDOMBatchTests();
    return allPassed ? EXIT_SUCCESS : EXIT_FAILURE;
}
