#pragma once

#include <memory>
#include <string>
#include <utility>

namespace reactdom {

class ReactDOMInstance : public std::enable_shared_from_this<ReactDOMInstance> {
public:
  virtual ~ReactDOMInstance() = default;

  void setKey(std::string key) { key_ = std::move(key); }
  [[nodiscard]] const std::string& getKey() const noexcept { return key_; }

  [[nodiscard]] std::shared_ptr<ReactDOMInstance> getParent() const { return parent_.lock(); }
  void setParent(const std::shared_ptr<ReactDOMInstance>& parent) { parent_ = parent; }
  void clearParent() { parent_.reset(); }

  [[nodiscard]] virtual bool isTextInstance() const = 0;
  // Concatenated text of this node and its descendants, like DOM textContent.
  [[nodiscard]] virtual std::string textContent() const = 0;
  [[nodiscard]] virtual std::string debugDescription() const = 0;

protected:
  ReactDOMInstance() = default;

private:
  std::weak_ptr<ReactDOMInstance> parent_;
  std::string key_{};
};

} // namespace reactdom
