#pragma once

#include <memory>

namespace facebook {
namespace jsi {
class Runtime;
} // namespace jsi
} // namespace facebook

namespace reactdom {

class ReactRuntime;

/**
 * Installs `ReactDOMRoot` on the JS global object:
 *
 *   const container = ReactDOMRoot.createContainer();
 *   const root = ReactDOMRoot.createRoot(container, {hydrate: false});
 *   root.render({type: 'div', props: {children: 'Hi'}}).then(() => {});
 *
 * Root, batch and work objects expose the same methods as their C++ types.
 * C++ exceptions surface in JS as errors.
 */
void installReactDOMRoot(facebook::jsi::Runtime& jsRuntime, std::shared_ptr<ReactRuntime> runtime);

} // namespace reactdom
