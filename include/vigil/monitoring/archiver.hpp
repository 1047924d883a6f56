#pragma once

#include <spdlog/spdlog.h>
#include <vigil/schema/primitives.hpp>
#include <vigil/storage/storage.hpp>
#include <cstdint>

namespace vigil::monitoring {

struct archive_report final {
  vigil::schema::timestamp_milliseconds_t cutoff{};
  uint64_t moved{};
  bool failed{false};
};

/// Move transactions older than retention_days (relative to now) into the
/// archive area. A retention of zero disables archiving. Failures are logged
/// and retried by the next call; the store never commits a partial move.
template <typename Library>
archive_report archive_expired(vigil::storage::storage<Library>& storage,
                               const uint32_t retention_days,
                               const vigil::schema::timestamp_milliseconds_t now) {
  auto report = archive_report{};
  if (retention_days == 0) {
    return report;
  }

  auto window = static_cast<vigil::schema::duration_milliseconds_t>(
                    retention_days) *
                vigil::schema::kMillisecondsPerDay;
  report.cutoff = now > window ? now - window : 0;
  try {
    report.moved = storage.move_to_archive(report.cutoff);
    if (report.moved > 0) {
      spdlog::info("Archived {} transaction(s) older than {} days",
                   report.moved, retention_days);
    }
  } catch (const vigil::storage::storage_unavailable& ex) {
    spdlog::error("Archive failure for cutoff {}: {}", report.cutoff,
                  ex.what());
    report.failed = true;
  }
  return report;
}

}  // namespace vigil::monitoring
