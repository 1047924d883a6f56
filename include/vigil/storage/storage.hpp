#pragma once
#include <vigil/schema/alert.hpp>
#include <vigil/schema/primitives.hpp>
#include <vigil/schema/transaction.hpp>
#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string_view>
#include <vector>

namespace vigil::storage {

/// Connection or query failure. Recoverable inside a monitoring pass: the
/// loop logs it and retries on the next interval.
struct storage_unavailable final : std::runtime_error {
  using std::runtime_error::runtime_error;
};

template <typename Library>
struct storage {
  /// Return every active transaction with reviewed == false, in key order.
  std::vector<vigil::schema::transaction_t> fetch_unreviewed() const;

  /// Insert or overwrite an active transaction (upstream ingestion).
  void put_transaction(const vigil::schema::transaction_t& transaction) const;

  /// Look up an active transaction by id.
  std::optional<vigil::schema::transaction_t> find_transaction(
      const std::string_view id) const;

  /// Look up an archived transaction by id.
  std::optional<vigil::schema::transaction_t> find_archived(
      const std::string_view id) const;

  /// Set reviewed = true on every listed transaction in a single atomic write.
  void mark_reviewed(
      const std::vector<vigil::schema::transaction_id_t>& ids) const;

  /// Atomically move active transactions with timestamp < older_than into the
  /// archive area. Returns the number of records moved.
  uint64_t move_to_archive(
      const vigil::schema::timestamp_milliseconds_t older_than) const;

  /// Persist an alert, assigning the next id. Returns the stored record.
  vigil::schema::alert_t insert_alert(vigil::schema::alert_t alert) const;

  /// True when an alert already references the transaction.
  bool has_alert(const std::string_view transaction_id) const;

  /// Ordered alert stream starting at from_id (inclusive).
  std::vector<vigil::schema::alert_t> list_alerts(
      const vigil::schema::alert_id_t from_id,
      const std::size_t limit) const;

  /// Release the underlying connection. Further calls raise
  /// storage_unavailable.
  void close();
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace vigil::storage
