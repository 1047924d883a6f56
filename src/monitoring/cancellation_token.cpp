#include <vigil/monitoring/cancellation_token.hpp>

namespace vigil::monitoring {

void cancellation_token::request_stop() {
  {
    auto lock = std::scoped_lock{mutex_};
    stopped_ = true;
  }
  condition_.notify_all();
}

bool cancellation_token::stop_requested() const {
  auto lock = std::scoped_lock{mutex_};
  return stopped_;
}

bool cancellation_token::wait_for(const std::chrono::milliseconds timeout) {
  auto lock = std::unique_lock{mutex_};
  return condition_.wait_for(lock, timeout, [this] { return stopped_; });
}

}  // namespace vigil::monitoring
