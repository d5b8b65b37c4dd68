#include "ReactDOM/client/ReactDOMComponent.h"

#include <utility>

namespace reactdom {

ReactDOMComponent::ReactDOMComponent(
    std::string type,
    Props props,
    bool isTextInstance,
    std::string textContent)
    : type_(std::move(type)),
      isTextInstance_(isTextInstance),
      props_(std::move(props)),
      textContent_(std::move(textContent)) {}

bool ReactDOMComponent::isTextInstance() const {
  return isTextInstance_;
}

const std::string& ReactDOMComponent::getType() const noexcept {
  return type_;
}

const Props& ReactDOMComponent::getProps() const noexcept {
  return props_;
}

const std::string& ReactDOMComponent::getTextContent() const noexcept {
  return textContent_;
}

void ReactDOMComponent::setProps(Props props) {
  props_ = std::move(props);
}

void ReactDOMComponent::setTextContent(std::string text) {
  textContent_ = std::move(text);
  isTextInstance_ = true;
}

std::string ReactDOMComponent::textContent() const {
  std::string out;
  appendTextContent(out);
  return out;
}

void ReactDOMComponent::appendTextContent(std::string& out) const {
  if (isTextInstance_) {
    out += textContent_;
    return;
  }
  for (const auto& child : children) {
    if (!child) {
      continue;
    }
    if (auto component = std::dynamic_pointer_cast<ReactDOMComponent>(child)) {
      component->appendTextContent(out);
    } else {
      out += child->textContent();
    }
  }
}

std::string ReactDOMComponent::debugDescription() const {
  if (isTextInstance_) {
    return "#text{" + textContent_ + "}";
  }
  std::string description = "<" + type_;
  for (const auto& prop : props_) {
    description += " " + prop.first + "=\"" + propValueToString(prop.second) + "\"";
  }
  description += ">";
  for (const auto& child : children) {
    if (child) {
      description += child->debugDescription();
    }
  }
  description += "</" + type_ + ">";
  return description;
}

} // namespace reactdom
