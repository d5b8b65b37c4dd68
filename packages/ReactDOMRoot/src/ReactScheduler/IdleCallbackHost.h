#pragma once

#include <cstdint>
#include <functional>

namespace reactdom {

class IdleDeadline {
public:
  virtual ~IdleDeadline() = default;

  // Milliseconds left in the current slice; zero or less means the slice is over.
  [[nodiscard]] virtual double timeRemaining() const = 0;
  [[nodiscard]] virtual bool didTimeout() const { return false; }
};

using IdleCallback = std::function<void(const IdleDeadline&)>;

struct IdleCallbackToken {
  std::uint64_t id{0};

  explicit operator bool() const noexcept {
    return id != 0;
  }

  bool operator==(const IdleCallbackToken& other) const noexcept {
    return id == other.id;
  }
};

/**
 * The host's idle-time primitive.
 *
 * Each requested callback runs at most once. The work loop requests a new
 * one whenever it stops with work left.
 */
class IdleCallbackHost {
public:
  virtual ~IdleCallbackHost() = default;

  virtual IdleCallbackToken requestIdleCallback(IdleCallback callback) = 0;
  virtual void cancelIdleCallback(IdleCallbackToken token) = 0;

  // Host clock in milliseconds.
  [[nodiscard]] virtual double now() const = 0;
};

} // namespace reactdom
