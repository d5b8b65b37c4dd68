#include "ReactReconciler/ReactWork.h"

#include <exception>
#include <utility>

namespace reactdom {

ReactWork::ReactWork(std::uint64_t targetUpdateId)
    : targetUpdateId_(targetUpdateId) {}

void ReactWork::then(Callback onCommit) {
  if (!onCommit) {
    return;
  }
  if (state_ == State::Committed) {
    onCommit();
    return;
  }
  callbacks_.push_back(std::move(onCommit));
}

void ReactWork::commit() {
  if (state_ == State::Committed) {
    return;
  }
  state_ = State::Committed;

  std::vector<Callback> callbacks;
  callbacks.swap(callbacks_);

  std::exception_ptr firstError;
  for (auto& callback : callbacks) {
    try {
      callback();
    } catch (...) {
      if (!firstError) {
        firstError = std::current_exception();
      }
    }
  }
  if (firstError) {
    std::rethrow_exception(firstError);
  }
}

} // namespace reactdom
