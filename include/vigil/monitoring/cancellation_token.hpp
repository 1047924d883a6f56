#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>

namespace vigil::monitoring {

/// Stop request shared between the signal watcher and the monitoring loop.
/// The loop only observes it between passes and while sleeping.
class cancellation_token final {
 public:
  cancellation_token() = default;
  cancellation_token(const cancellation_token&) = delete;
  cancellation_token& operator=(const cancellation_token&) = delete;

  void request_stop();
  bool stop_requested() const;

  /// Sleep for at most timeout. Returns true as soon as a stop is requested.
  bool wait_for(std::chrono::milliseconds timeout);

 private:
  mutable std::mutex mutex_;
  std::condition_variable condition_;
  bool stopped_{false};
};

}  // namespace vigil::monitoring
