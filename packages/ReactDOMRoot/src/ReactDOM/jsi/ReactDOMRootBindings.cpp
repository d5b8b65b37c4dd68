#include "ReactDOM/jsi/ReactDOMRootBindings.h"

#include "ReactDOM/client/ReactDOMBatch.h"
#include "ReactDOM/client/ReactDOMRoot.h"
#include "ReactRuntime/ReactHostInterface.h"
#include "ReactRuntime/ReactJSXRuntime.h"
#include "ReactRuntime/ReactRuntime.h"

#include "jsi/jsi.h"

#include <cstddef>
#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace reactdom {

namespace jsi = facebook::jsi;

namespace {

using HostFunction = std::function<jsi::Value(jsi::Runtime&, const jsi::Value*, std::size_t)>;

jsi::Function makeMethod(jsi::Runtime& jsRuntime, const char* name, unsigned int paramCount, HostFunction body) {
  return jsi::Function::createFromHostFunction(
    jsRuntime,
    jsi::PropNameID::forAscii(jsRuntime, name),
    paramCount,
    [body = std::move(body)](jsi::Runtime& runtimeRef, const jsi::Value&, const jsi::Value* args, std::size_t count) {
      try {
        return body(runtimeRef, args, count);
      } catch (const jsi::JSError&) {
        throw;
      } catch (const std::exception& ex) {
        throw jsi::JSError(runtimeRef, ex.what());
      }
    });
}

const jsi::Value& argumentAt(const jsi::Value* args, std::size_t count, std::size_t index) {
  static const jsi::Value undefinedValue;
  return index < count ? args[index] : undefinedValue;
}

std::shared_ptr<jsi::Function> callbackArgument(jsi::Runtime& jsRuntime, const jsi::Value& value, const char* method) {
  if (!value.isObject() || !value.getObject(jsRuntime).isFunction(jsRuntime)) {
    throw jsi::JSError(jsRuntime, std::string(method) + " expects a function");
  }
  return std::make_shared<jsi::Function>(value.getObject(jsRuntime).getFunction(jsRuntime));
}

jsi::Object propsToObject(jsi::Runtime& jsRuntime, const Props& props, const ReactNode& children) {
  jsi::Object object(jsRuntime);
  for (const auto& [name, value] : props) {
    if (const auto* flag = std::get_if<bool>(&value)) {
      object.setProperty(jsRuntime, name.c_str(), *flag);
    } else if (const auto* number = std::get_if<double>(&value)) {
      object.setProperty(jsRuntime, name.c_str(), *number);
    } else if (const auto* text = std::get_if<std::string>(&value)) {
      object.setProperty(jsRuntime, name.c_str(), jsi::String::createFromUtf8(jsRuntime, *text));
    }
  }
  // Only text children round-trip to JS components.
  if (children.kind() == ReactNode::Kind::Text) {
    object.setProperty(jsRuntime, "children", jsi::String::createFromUtf8(jsRuntime, children.text()));
  }
  return object;
}

ReactNode reactNodeFromValue(jsi::Runtime& jsRuntime, const jsi::Value& value);

ElementType elementTypeFromValue(jsi::Runtime& jsRuntime, const jsi::Value& value) {
  if (value.isString()) {
    return value.getString(jsRuntime).utf8(jsRuntime);
  }
  if (value.isObject()) {
    jsi::Object object = value.getObject(jsRuntime);
    if (object.isFunction(jsRuntime)) {
      auto function = std::make_shared<jsi::Function>(object.getFunction(jsRuntime));
      std::string displayName = "Anonymous";
      jsi::Value nameValue = function->getProperty(jsRuntime, "name");
      if (nameValue.isString()) {
        displayName = nameValue.getString(jsRuntime).utf8(jsRuntime);
      }
      jsi::Runtime* runtimePtr = &jsRuntime;
      return jsx::component(
        std::move(displayName),
        [runtimePtr, function](const Props& props, const ReactNode& children) {
          jsi::Runtime& runtimeRef = *runtimePtr;
          jsi::Value rendered = function->call(runtimeRef, propsToObject(runtimeRef, props, children));
          return reactNodeFromValue(runtimeRef, rendered);
        });
    }
  }
  return std::monostate{};
}

ReactNode reactNodeFromValue(jsi::Runtime& jsRuntime, const jsi::Value& value) {
  if (value.isUndefined() || value.isNull() || value.isBool()) {
    return ReactNode{};
  }
  if (value.isString()) {
    return ReactNode{value.getString(jsRuntime).utf8(jsRuntime)};
  }
  if (value.isNumber()) {
    return ReactNode{value.getNumber()};
  }
  if (!value.isObject()) {
    return ReactNode{};
  }

  jsi::Object object = value.getObject(jsRuntime);
  if (object.isArray(jsRuntime)) {
    jsi::Array array = object.getArray(jsRuntime);
    std::vector<ReactNode> fragment;
    const std::size_t length = array.size(jsRuntime);
    fragment.reserve(length);
    for (std::size_t index = 0; index < length; ++index) {
      fragment.push_back(reactNodeFromValue(jsRuntime, array.getValueAtIndex(jsRuntime, index)));
    }
    return ReactNode{std::move(fragment)};
  }

  ElementType type = elementTypeFromValue(jsRuntime, object.getProperty(jsRuntime, "type"));

  Props props;
  ReactNode children;
  std::optional<std::string> key;
  jsi::Value propsValue = object.getProperty(jsRuntime, "props");
  if (propsValue.isObject()) {
    jsi::Object propsObject = propsValue.getObject(jsRuntime);
    jsi::Array names = propsObject.getPropertyNames(jsRuntime);
    const std::size_t length = names.size(jsRuntime);
    for (std::size_t index = 0; index < length; ++index) {
      std::string name = names.getValueAtIndex(jsRuntime, index).getString(jsRuntime).utf8(jsRuntime);
      jsi::Value propValue = propsObject.getProperty(jsRuntime, name.c_str());
      if (name == "children") {
        children = reactNodeFromValue(jsRuntime, propValue);
      } else if (propValue.isBool()) {
        props[name] = propValue.getBool();
      } else if (propValue.isNumber()) {
        props[name] = propValue.getNumber();
      } else if (propValue.isString()) {
        props[name] = propValue.getString(jsRuntime).utf8(jsRuntime);
      }
    }
  }
  jsi::Value keyValue = object.getProperty(jsRuntime, "key");
  if (keyValue.isString()) {
    key = keyValue.getString(jsRuntime).utf8(jsRuntime);
  }

  return ReactNode{jsx::createElement(std::move(type), std::move(props), std::move(children), std::move(key))};
}

class WorkHostObject : public jsi::HostObject {
 public:
  explicit WorkHostObject(std::shared_ptr<ReactWork> work)
      : work_(std::move(work)) {}

  std::vector<jsi::PropNameID> getPropertyNames(jsi::Runtime& jsRuntime) override {
    return jsi::PropNameID::names(jsRuntime, "then");
  }

  jsi::Value get(jsi::Runtime& jsRuntime, const jsi::PropNameID& name) override {
    if (name.utf8(jsRuntime) != "then") {
      return jsi::Value::undefined();
    }
    auto work = work_;
    return makeMethod(jsRuntime, "then", 1, [work](jsi::Runtime& runtimeRef, const jsi::Value* args, std::size_t count) {
      auto callback = callbackArgument(runtimeRef, argumentAt(args, count, 0), "then");
      jsi::Runtime* runtimePtr = &runtimeRef;
      work->then([runtimePtr, callback]() { callback->call(*runtimePtr); });
      return jsi::Value::undefined();
    });
  }

 private:
  std::shared_ptr<ReactWork> work_;
};

jsi::Value wrapWork(jsi::Runtime& jsRuntime, std::shared_ptr<ReactWork> work) {
  return jsi::Object::createFromHostObject(jsRuntime, std::make_shared<WorkHostObject>(std::move(work)));
}

class BatchHostObject : public jsi::HostObject {
 public:
  explicit BatchHostObject(std::shared_ptr<ReactBatch> batch)
      : batch_(std::move(batch)) {}

  std::vector<jsi::PropNameID> getPropertyNames(jsi::Runtime& jsRuntime) override {
    return jsi::PropNameID::names(jsRuntime, "render", "commit", "then", "onComplete");
  }

  jsi::Value get(jsi::Runtime& jsRuntime, const jsi::PropNameID& name) override {
    const std::string property = name.utf8(jsRuntime);
    auto batch = batch_;

    if (property == "render") {
      return makeMethod(jsRuntime, "render", 1, [batch](jsi::Runtime& runtimeRef, const jsi::Value* args, std::size_t count) {
        return wrapWork(runtimeRef, batch->render(reactNodeFromValue(runtimeRef, argumentAt(args, count, 0))));
      });
    }
    if (property == "commit") {
      return makeMethod(jsRuntime, "commit", 0, [batch](jsi::Runtime&, const jsi::Value*, std::size_t) {
        batch->commit();
        return jsi::Value::undefined();
      });
    }
    if (property == "then" || property == "onComplete") {
      const bool isThen = property == "then";
      return makeMethod(
        jsRuntime,
        isThen ? "then" : "onComplete",
        1,
        [batch, isThen](jsi::Runtime& runtimeRef, const jsi::Value* args, std::size_t count) {
          auto callback = callbackArgument(runtimeRef, argumentAt(args, count, 0), isThen ? "then" : "onComplete");
          jsi::Runtime* runtimePtr = &runtimeRef;
          auto invoke = [runtimePtr, callback]() { callback->call(*runtimePtr); };
          if (isThen) {
            batch->then(std::move(invoke));
          } else {
            batch->onComplete(std::move(invoke));
          }
          return jsi::Value::undefined();
        });
    }
    return jsi::Value::undefined();
  }

 private:
  std::shared_ptr<ReactBatch> batch_;
};

class RootHostObject : public jsi::HostObject {
 public:
  explicit RootHostObject(std::shared_ptr<ReactDOMRoot> root)
      : root_(std::move(root)) {}

  std::vector<jsi::PropNameID> getPropertyNames(jsi::Runtime& jsRuntime) override {
    return jsi::PropNameID::names(jsRuntime, "render", "unmount", "createBatch", "flushSync");
  }

  jsi::Value get(jsi::Runtime& jsRuntime, const jsi::PropNameID& name) override {
    const std::string property = name.utf8(jsRuntime);
    auto root = root_;

    if (property == "render") {
      return makeMethod(jsRuntime, "render", 1, [root](jsi::Runtime& runtimeRef, const jsi::Value* args, std::size_t count) {
        return wrapWork(runtimeRef, root->render(reactNodeFromValue(runtimeRef, argumentAt(args, count, 0))));
      });
    }
    if (property == "unmount") {
      return makeMethod(jsRuntime, "unmount", 0, [root](jsi::Runtime& runtimeRef, const jsi::Value*, std::size_t) {
        return wrapWork(runtimeRef, root->unmount());
      });
    }
    if (property == "createBatch") {
      return makeMethod(jsRuntime, "createBatch", 0, [root](jsi::Runtime& runtimeRef, const jsi::Value*, std::size_t) {
        return jsi::Value(
          runtimeRef,
          jsi::Object::createFromHostObject(runtimeRef, std::make_shared<BatchHostObject>(root->createBatch())));
      });
    }
    if (property == "flushSync") {
      return makeMethod(jsRuntime, "flushSync", 0, [root](jsi::Runtime&, const jsi::Value*, std::size_t) {
        root->flushSync();
        return jsi::Value::undefined();
      });
    }
    return jsi::Value::undefined();
  }

 private:
  std::shared_ptr<ReactDOMRoot> root_;
};

class ContainerHostObject : public jsi::HostObject {
 public:
  explicit ContainerHostObject(hostconfig::HostContainer container)
      : container_(std::move(container)) {}

  const hostconfig::HostContainer& container() const noexcept { return container_; }

  std::vector<jsi::PropNameID> getPropertyNames(jsi::Runtime& jsRuntime) override {
    return jsi::PropNameID::names(jsRuntime, "textContent", "innerHTML");
  }

  jsi::Value get(jsi::Runtime& jsRuntime, const jsi::PropNameID& name) override {
    const std::string property = name.utf8(jsRuntime);
    if (property == "textContent") {
      return jsi::String::createFromUtf8(jsRuntime, container_->textContent());
    }
    if (property == "innerHTML") {
      std::string html;
      if (auto component = std::dynamic_pointer_cast<ReactDOMComponent>(container_)) {
        for (const auto& child : component->children) {
          html += child->debugDescription();
        }
      }
      return jsi::String::createFromUtf8(jsRuntime, html);
    }
    return jsi::Value::undefined();
  }

 private:
  hostconfig::HostContainer container_;
};

} // namespace

void installReactDOMRoot(jsi::Runtime& jsRuntime, std::shared_ptr<ReactRuntime> runtime) {
  if (!runtime) {
    throw jsi::JSError(jsRuntime, "installReactDOMRoot requires a runtime");
  }

  jsi::Object api(jsRuntime);

  api.setProperty(
    jsRuntime,
    "createContainer",
    makeMethod(jsRuntime, "createContainer", 0, [runtime](jsi::Runtime& runtimeRef, const jsi::Value*, std::size_t) {
      auto container = runtime->hostInterface()->createContainer();
      return jsi::Value(
        runtimeRef,
        jsi::Object::createFromHostObject(runtimeRef, std::make_shared<ContainerHostObject>(container)));
    }));

  api.setProperty(
    jsRuntime,
    "createRoot",
    makeMethod(jsRuntime, "createRoot", 2, [runtime](jsi::Runtime& runtimeRef, const jsi::Value* args, std::size_t count) {
      const jsi::Value& containerValue = argumentAt(args, count, 0);
      if (!containerValue.isObject() ||
          !containerValue.getObject(runtimeRef).isHostObject<ContainerHostObject>(runtimeRef)) {
        throw jsi::JSError(runtimeRef, "createRoot expects a container from ReactDOMRoot.createContainer()");
      }
      auto containerObject = containerValue.getObject(runtimeRef).getHostObject<ContainerHostObject>(runtimeRef);

      RootOptions options;
      const jsi::Value& optionsValue = argumentAt(args, count, 1);
      if (optionsValue.isObject()) {
        jsi::Value hydrate = optionsValue.getObject(runtimeRef).getProperty(runtimeRef, "hydrate");
        options.hydrate = hydrate.isBool() && hydrate.getBool();
      }

      auto root = runtime->createRoot(containerObject->container(), options);
      return jsi::Value(
        runtimeRef,
        jsi::Object::createFromHostObject(runtimeRef, std::make_shared<RootHostObject>(std::move(root))));
    }));

  jsRuntime.global().setProperty(jsRuntime, "ReactDOMRoot", std::move(api));
}

} // namespace reactdom
