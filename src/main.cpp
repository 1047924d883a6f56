#include <csignal>
#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <vigil/common/critical.hpp>
#include <vigil/config/config.hpp>
#include <vigil/monitoring/loop.hpp>
#include <vigil/storage/rocksdb/storage.hpp>
#include <atomic>
#include <chrono>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>

std::atomic<bool>& shutdown_requested() {
  static std::atomic<bool> requested{};
  return requested;
}

void signal_handler(int) {
  shutdown_requested() = true;
}

void install_logger(const vigil::config::logging_config& logging) {
  spdlog::init_thread_pool(8192, 1);

  auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  auto file_sink =
      std::make_shared<spdlog::sinks::basic_file_sink_mt>(logging.file, false);

  auto logger = std::make_shared<spdlog::async_logger>(
      "vigil", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);

  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(logging.level);
}

int main(int argc, char* argv[]) {
  shutdown_requested() = false;
  std::signal(SIGINT, signal_handler);
  std::signal(SIGTERM, signal_handler);

  auto config = std::optional<vigil::config::monitor_config>{};
  try {
    config = vigil::config::parse_config(argc, argv, std::cout);
  } catch (const boost::program_options::error& ex) {
    std::cerr << "vigild: " << ex.what() << std::endl;
    return 1;
  } catch (const vigil::config::config_error& ex) {
    std::cerr << "vigild: " << ex.what() << std::endl;
    return 1;
  }
  if (!config) {
    return 0;
  }

  try {
    install_logger(config->logging);
  } catch (const spdlog::spdlog_ex& ex) {
    std::cerr << "vigild: cannot create logger: " << ex.what() << std::endl;
    return 1;
  }

  spdlog::info("Starting {} monitoring with {} rule(s), polling every {}s",
               vigil::schema::asset_class_name(config->asset_class),
               config->policy.rules.size(),
               std::chrono::duration_cast<std::chrono::seconds>(
                   config->loop.poll_interval)
                   .count());

  auto storage = vigil::storage::storage<vigil::storage::rocksdb_storage_tag>{};
  try {
    storage = vigil::storage::make_storage<vigil::storage::rocksdb_storage_tag>(
        config->db_path);
  } catch (const vigil::storage::storage_unavailable& ex) {
    vigil::common::critical("Cannot open transaction store: {}", ex.what());
  }

  auto token = vigil::monitoring::cancellation_token{};
  auto loop =
      vigil::monitoring::monitoring_loop<vigil::storage::rocksdb_storage_tag>{
          std::move(storage), config->policy, config->loop, token};

  auto watcher = std::thread{[&] {
    while (!shutdown_requested() && !token.stop_requested()) {
      std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
    if (shutdown_requested()) {
      spdlog::info("Shutdown requested; finishing the current pass");
    }
    token.request_stop();
  }};

  loop.run();
  token.request_stop();
  watcher.join();

  spdlog::shutdown();
  return 0;
}
