#pragma once

#include <spdlog/spdlog.h>
#include <vigil/detection/policy.hpp>
#include <vigil/monitoring/archiver.hpp>
#include <vigil/monitoring/cancellation_token.hpp>
#include <vigil/monitoring/clock.hpp>
#include <vigil/monitoring/monitor.hpp>
#include <vigil/storage/storage.hpp>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <exception>
#include <string_view>
#include <utility>

namespace vigil::monitoring {

enum class loop_state_t : uint8_t {
  idle = 0,
  running_pass = 1,
  sleeping = 2,
  shutting_down = 3,
  stopped = 4,
};

constexpr std::string_view loop_state_name(const loop_state_t state) {
  switch (state) {
    case loop_state_t::idle:
      return "idle";
    case loop_state_t::running_pass:
      return "running-pass";
    case loop_state_t::sleeping:
      return "sleeping";
    case loop_state_t::shutting_down:
      return "shutting-down";
    case loop_state_t::stopped:
      return "stopped";
  }
  return "unknown";
}

struct loop_options final {
  std::chrono::milliseconds poll_interval{std::chrono::seconds{300}};
  uint32_t retention_days{30};
  // Zero runs until a stop is requested.
  uint64_t max_passes{};
};

/// Supervised monitoring loop.
///
/// Owns the storage handle for its whole lifetime and closes it on the way
/// to stopped. A stop request is honoured between passes and interrupts the
/// sleep phase immediately; a pass that has started always runs to its end.
template <typename Library>
class monitoring_loop final {
 public:
  monitoring_loop(vigil::storage::storage<Library> storage,
                  vigil::detection::detection_policy policy,
                  const loop_options options,
                  cancellation_token& token,
                  now_fn_t now = system_now)
      : storage_{std::move(storage)},
        monitor_{storage_, std::move(policy), now},
        options_{options},
        token_{token},
        now_{std::move(now)} {}

  monitoring_loop(const monitoring_loop&) = delete;
  monitoring_loop& operator=(const monitoring_loop&) = delete;
  monitoring_loop(monitoring_loop&&) = delete;
  monitoring_loop& operator=(monitoring_loop&&) = delete;

  /// Run until stopped. Returns the number of completed passes.
  uint64_t run();

  loop_state_t state() const { return state_.load(); }

  vigil::storage::storage<Library>& storage() { return storage_; }

 private:
  void transition(loop_state_t next);
  void run_pass(vigil::schema::pass_id_t pass_id);

  vigil::storage::storage<Library> storage_;
  monitor<Library> monitor_;
  loop_options options_;
  cancellation_token& token_;
  now_fn_t now_;
  std::atomic<loop_state_t> state_{loop_state_t::idle};
};

template <typename Library>
uint64_t monitoring_loop<Library>::run() {
  auto passes = uint64_t{};
  while (!token_.stop_requested()) {
    transition(loop_state_t::running_pass);
    run_pass(passes + 1);
    ++passes;

    if (options_.max_passes != 0 && passes >= options_.max_passes) {
      break;
    }
    transition(loop_state_t::sleeping);
    if (token_.wait_for(options_.poll_interval)) {
      break;
    }
  }

  transition(loop_state_t::shutting_down);
  storage_.close();
  transition(loop_state_t::stopped);
  spdlog::info("Monitoring loop stopped after {} pass(es)", passes);
  return passes;
}

template <typename Library>
void monitoring_loop<Library>::run_pass(const vigil::schema::pass_id_t pass_id) {
  try {
    monitor_.run_pass(pass_id);
  } catch (const vigil::storage::storage_unavailable& ex) {
    spdlog::error("Pass {}: storage unavailable, retrying next interval: {}",
                  pass_id, ex.what());
  } catch (const std::exception& ex) {
    spdlog::error("Pass {}: aborted, retrying next interval: {}", pass_id,
                  ex.what());
  }
  archive_expired(storage_, options_.retention_days, now_());
  spdlog::info("Monitoring pass {} completed", pass_id);
}

template <typename Library>
void monitoring_loop<Library>::transition(const loop_state_t next) {
  auto previous = state_.exchange(next);
  spdlog::debug("Monitoring loop {} -> {}", loop_state_name(previous),
                loop_state_name(next));
}

}  // namespace vigil::monitoring
