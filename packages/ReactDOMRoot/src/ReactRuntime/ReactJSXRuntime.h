#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace reactdom {

struct ReactElement;
struct ComponentType;

using ReactElementPtr = std::shared_ptr<const ReactElement>;
using ComponentTypePtr = std::shared_ptr<const ComponentType>;

using PropValue = std::variant<std::monostate, bool, double, std::string>;
using Props = std::map<std::string, PropValue>;

// std::monostate marks an invalid (undefined) type.
using ElementType = std::variant<std::monostate, std::string, ComponentTypePtr>;

class ReactNode {
public:
  enum class Kind : std::uint8_t {
    Empty,
    Text,
    Element,
    Fragment,
  };

  ReactNode() = default;
  ReactNode(std::nullptr_t) {}
  ReactNode(std::string text);
  ReactNode(const char* text);
  ReactNode(double number);
  ReactNode(int number);
  ReactNode(ReactElementPtr element);
  ReactNode(std::vector<ReactNode> fragment);

  [[nodiscard]] Kind kind() const noexcept { return kind_; }
  [[nodiscard]] bool isEmpty() const noexcept { return kind_ == Kind::Empty; }
  [[nodiscard]] const std::string& text() const noexcept { return text_; }
  [[nodiscard]] const ReactElementPtr& element() const noexcept { return element_; }
  [[nodiscard]] const std::vector<ReactNode>& fragment() const noexcept { return fragment_; }

private:
  Kind kind_{Kind::Empty};
  std::string text_{};
  ReactElementPtr element_{};
  std::vector<ReactNode> fragment_{};
};

struct ComponentType {
  using RenderFn = std::function<ReactNode(const Props& props, const ReactNode& children)>;

  std::string displayName;
  RenderFn render;
};

struct ReactElement {
  ElementType type;
  Props props;
  ReactNode children;
  std::optional<std::string> key;
  bool hasStaticChildren{false};
};

[[nodiscard]] bool isValidElementType(const ElementType& type);
[[nodiscard]] std::string describeElementType(const ElementType& type);
[[nodiscard]] std::string numberToString(double value);
[[nodiscard]] std::string propValueToString(const PropValue& value);

namespace jsx {

ReactElementPtr createElement(
    ElementType type,
    Props props = {},
    ReactNode children = {},
    std::optional<std::string> key = std::nullopt);

ReactElementPtr jsx(
    ElementType type,
    Props props = {},
    ReactNode child = {},
    std::optional<std::string> key = std::nullopt);

ReactElementPtr jsxs(
    ElementType type,
    Props props,
    std::vector<ReactNode> children,
    std::optional<std::string> key = std::nullopt);

ComponentTypePtr component(std::string displayName, ComponentType::RenderFn render);

} // namespace jsx

} // namespace reactdom
