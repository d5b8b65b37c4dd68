#pragma once

#include "ReactDOM/client/ReactDOMInstance.h"
#include "ReactRuntime/ReactJSXRuntime.h"

#include <memory>
#include <string>
#include <vector>

namespace reactdom {

class ReactDOMComponent final : public ReactDOMInstance {
public:
  explicit ReactDOMComponent(
      std::string type,
      Props props = {},
      bool isTextInstance = false,
      std::string textContent = {}
  );

  [[nodiscard]] bool isTextInstance() const override;
  [[nodiscard]] const std::string& getType() const noexcept;
  [[nodiscard]] const Props& getProps() const noexcept;
  [[nodiscard]] const std::string& getTextContent() const noexcept;

  void setProps(Props props);
  void setTextContent(std::string text);

  [[nodiscard]] std::string textContent() const override;
  [[nodiscard]] std::string debugDescription() const override;

  std::vector<std::shared_ptr<ReactDOMInstance>> children;

private:
  void appendTextContent(std::string& out) const;

  std::string type_;
  bool isTextInstance_{false};
  Props props_;
  std::string textContent_{};
};

using ReactDOMComponentPtr = std::shared_ptr<ReactDOMComponent>;

} // namespace reactdom
