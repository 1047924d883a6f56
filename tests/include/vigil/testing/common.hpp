#pragma once

#include <vigil/schema/primitives.hpp>
#include <vigil/schema/transaction.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace vigil::testing {

// 2024-03-01T00:00:00Z
inline constexpr auto kBaseTime =
    vigil::schema::timestamp_milliseconds_t{1'709'251'200'000};

inline constexpr vigil::schema::duration_milliseconds_t seconds(
    const uint64_t count) {
  return count * vigil::schema::kMillisecondsPerSecond;
}

inline constexpr vigil::schema::duration_milliseconds_t minutes(
    const uint64_t count) {
  return seconds(count * 60);
}

inline constexpr vigil::schema::duration_milliseconds_t days(
    const uint64_t count) {
  return count * vigil::schema::kMillisecondsPerDay;
}

inline vigil::schema::transaction_t make_transaction(
    const std::string_view id,
    const std::string_view source,
    const std::string_view destination,
    const int64_t whole_amount,
    const vigil::schema::timestamp_milliseconds_t timestamp,
    const std::string_view jurisdiction = "US") {
  auto tx = vigil::schema::transaction_t{};
  tx.id = std::string{id};
  tx.source = std::string{source};
  tx.destination = std::string{destination};
  tx.amount = vigil::schema::make_amount(whole_amount);
  tx.timestamp = timestamp;
  tx.jurisdiction = std::string{jurisdiction};
  return tx;
}

inline std::string make_db_path(const std::string_view prefix) {
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    (std::string{prefix} + "_" +
                     std::to_string(static_cast<unsigned long long>(now)));
  return path.string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

}  // namespace vigil::testing
