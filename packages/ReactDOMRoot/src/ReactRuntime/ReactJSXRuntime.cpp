#include "ReactRuntime/ReactJSXRuntime.h"

#include "shared/ReactFeatureFlags.h"
#include "shared/ReactGlobalError.h"

#include <cmath>
#include <cstdio>
#include <string_view>
#include <utility>

namespace reactdom {

ReactNode::ReactNode(std::string text)
    : kind_(Kind::Text), text_(std::move(text)) {}

ReactNode::ReactNode(const char* text)
    : kind_(text != nullptr ? Kind::Text : Kind::Empty), text_(text != nullptr ? text : "") {}

ReactNode::ReactNode(double number)
    : kind_(Kind::Text), text_(numberToString(number)) {}

ReactNode::ReactNode(int number)
    : ReactNode(static_cast<double>(number)) {}

ReactNode::ReactNode(ReactElementPtr element)
    : kind_(element ? Kind::Element : Kind::Empty), element_(std::move(element)) {}

ReactNode::ReactNode(std::vector<ReactNode> fragment)
    : kind_(Kind::Fragment), fragment_(std::move(fragment)) {}

bool isValidElementType(const ElementType& type) {
  if (const auto* tag = std::get_if<std::string>(&type)) {
    return !tag->empty();
  }
  if (const auto* component = std::get_if<ComponentTypePtr>(&type)) {
    return *component && (*component)->render;
  }
  return false;
}

std::string describeElementType(const ElementType& type) {
  if (const auto* tag = std::get_if<std::string>(&type)) {
    return tag->empty() ? std::string("an empty string") : *tag;
  }
  if (const auto* component = std::get_if<ComponentTypePtr>(&type)) {
    if (!*component) {
      return "null";
    }
    return (*component)->displayName.empty() ? std::string("Component") : (*component)->displayName;
  }
  return "undefined";
}

std::string numberToString(double value) {
  if (std::isnan(value)) {
    return "NaN";
  }
  if (!std::isfinite(value)) {
    return value > 0 ? "Infinity" : "-Infinity";
  }

  char buffer[64];
  if (std::floor(value) == value && std::fabs(value) < 1e15) {
    std::snprintf(buffer, sizeof(buffer), "%lld", static_cast<long long>(value));
  } else {
    std::snprintf(buffer, sizeof(buffer), "%g", value);
  }
  return std::string(buffer);
}

std::string propValueToString(const PropValue& value) {
  if (const auto* text = std::get_if<std::string>(&value)) {
    return *text;
  }
  if (const auto* number = std::get_if<double>(&value)) {
    return numberToString(*number);
  }
  if (const auto* flag = std::get_if<bool>(&value)) {
    return *flag ? "true" : "false";
  }
  return std::string{};
}

namespace jsx {

namespace {

bool isReservedDevProp(std::string_view name) {
  return name == "__self" || name == "__source";
}

Props normalizeProps(Props props, std::optional<std::string>& key) {
  Props result;
  for (auto& entry : props) {
    if (entry.first == "key") {
      if (!key) {
        key = propValueToString(entry.second);
      }
      continue;
    }
    if (entry.first == "children" || isReservedDevProp(entry.first)) {
      continue;
    }
    result.emplace(entry.first, std::move(entry.second));
  }
  return result;
}

ReactElementPtr makeElement(
    ElementType type,
    Props props,
    ReactNode children,
    std::optional<std::string> key,
    bool hasStaticChildren) {
  if (warnAboutInvalidElementTypes && !isValidElementType(type)) {
    reportWarning(
      "React.createElement: type is invalid -- expected a string (for built-in components) or a "
      "function (for composite components) but got: " + describeElementType(type) + ".");
  }

  auto element = std::make_shared<ReactElement>();
  element->props = normalizeProps(std::move(props), key);
  element->type = std::move(type);
  element->children = std::move(children);
  element->key = std::move(key);
  element->hasStaticChildren = hasStaticChildren;
  return element;
}

} // namespace

ReactElementPtr createElement(
    ElementType type,
    Props props,
    ReactNode children,
    std::optional<std::string> key) {
  return makeElement(std::move(type), std::move(props), std::move(children), std::move(key), false);
}

ReactElementPtr jsx(
    ElementType type,
    Props props,
    ReactNode child,
    std::optional<std::string> key) {
  return makeElement(std::move(type), std::move(props), std::move(child), std::move(key), false);
}

ReactElementPtr jsxs(
    ElementType type,
    Props props,
    std::vector<ReactNode> children,
    std::optional<std::string> key) {
  return makeElement(
    std::move(type), std::move(props), ReactNode(std::move(children)), std::move(key), true);
}

ComponentTypePtr component(std::string displayName, ComponentType::RenderFn render) {
  auto type = std::make_shared<ComponentType>();
  type->displayName = std::move(displayName);
  type->render = std::move(render);
  return type;
}

} // namespace jsx

} // namespace reactdom
