#pragma once
#include <boost/endian/buffers.hpp>
#include <rocksdb/db.h>
#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <rocksdb/write_batch.h>
#include <spdlog/spdlog.h>
#include <vigil/schema/encoding/scale/encoder.hpp>
#include <vigil/storage/storage.hpp>
#include <iterator>
#include <memory>
#include <string>
#include <string_view>

namespace vigil::storage {

namespace detail {

using encoder_t =
    vigil::schema::encoding::encoder<vigil::schema::encoding::scale_encoder_tag>;

inline constexpr auto kActivePrefix = std::string_view{"TX|ACTIVE|"};
inline constexpr auto kArchivePrefix = std::string_view{"TX|ARCHIVE|"};
inline constexpr auto kAlertPrefix = std::string_view{"ALERT|"};
inline constexpr auto kAlertByTransactionPrefix = std::string_view{"ALERT_TX|"};
inline constexpr auto kNextAlertIdKey = std::string_view{"SYS|ALERT|NEXT_ID"};

inline std::string make_key(const std::string_view prefix,
                            const std::string_view id) {
  auto key = std::string{prefix};
  key.append(id);
  return key;
}

// Big-endian so that iteration order matches numeric id order.
inline std::string make_alert_key(const vigil::schema::alert_id_t id) {
  auto buffer = boost::endian::big_uint64_buf_t{id};
  auto key = std::string{kAlertPrefix};
  key.append(reinterpret_cast<const char*>(buffer.data()), sizeof(buffer));
  return key;
}

inline vigil::schema::bytes_view_t to_bytes_view(
    const ROCKSDB_NAMESPACE::Slice& slice) {
  return {reinterpret_cast<const uint8_t*>(slice.data()), slice.size()};
}

inline ROCKSDB_NAMESPACE::Slice to_slice(const vigil::schema::bytes_t& bytes) {
  return {reinterpret_cast<const char*>(bytes.data()), bytes.size()};
}

inline ROCKSDB_NAMESPACE::WriteOptions durable_write_options() {
  auto options = ROCKSDB_NAMESPACE::WriteOptions{};
  options.sync = true;
  return options;
}

inline void check_status(const ROCKSDB_NAMESPACE::Status& status,
                         const std::string_view what) {
  if (!status.ok()) {
    spdlog::error("{}: {}", what, status.ToString());
    throw storage_unavailable{std::string{what} + ": " + status.ToString()};
  }
}

template <typename T>
std::optional<T> decode_record(const ROCKSDB_NAMESPACE::Slice& key,
                               const ROCKSDB_NAMESPACE::Slice& value) {
  auto encoder = encoder_t{};
  auto decoded = encoder.try_decode<T>(to_bytes_view(value));
  if (!decoded.has_value()) {
    spdlog::error("Failed decoding record for key '{}'", key.ToString());
  }
  return decoded;
}

}  // namespace detail

struct rocksdb_storage_tag {};

template <>
struct storage<rocksdb_storage_tag> final {
  std::unique_ptr<ROCKSDB_NAMESPACE::DB> database;

  std::vector<vigil::schema::transaction_t> fetch_unreviewed() const;
  void put_transaction(const vigil::schema::transaction_t& transaction) const;
  std::optional<vigil::schema::transaction_t> find_transaction(
      const std::string_view id) const;
  std::optional<vigil::schema::transaction_t> find_archived(
      const std::string_view id) const;
  void mark_reviewed(
      const std::vector<vigil::schema::transaction_id_t>& ids) const;
  uint64_t move_to_archive(
      const vigil::schema::timestamp_milliseconds_t older_than) const;
  vigil::schema::alert_t insert_alert(vigil::schema::alert_t alert) const;
  bool has_alert(const std::string_view transaction_id) const;
  std::vector<vigil::schema::alert_t> list_alerts(
      const vigil::schema::alert_id_t from_id,
      const std::size_t limit) const;
  void close();

 private:
  void ensure_open() const;
  std::optional<vigil::schema::transaction_t> find_by_key(
      const std::string& key) const;
};

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path);

inline void storage<rocksdb_storage_tag>::ensure_open() const {
  if (!database) {
    throw storage_unavailable{"RocksDB database is not open"};
  }
}

inline std::optional<vigil::schema::transaction_t>
storage<rocksdb_storage_tag>::find_by_key(const std::string& key) const {
  ensure_open();
  auto value = std::string{};
  auto status = database->Get(ROCKSDB_NAMESPACE::ReadOptions{}, key, &value);
  if (status.IsNotFound()) {
    return std::nullopt;
  }
  detail::check_status(status, "Failed to read transaction from RocksDB");
  return detail::decode_record<vigil::schema::transaction_t>(key, value);
}

inline std::vector<vigil::schema::transaction_t>
storage<rocksdb_storage_tag>::fetch_unreviewed() const {
  ensure_open();
  auto transactions = std::vector<vigil::schema::transaction_t>{};

  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database->NewIterator(ROCKSDB_NAMESPACE::ReadOptions{})};
  iterator->Seek(std::string{detail::kActivePrefix});
  while (iterator->Valid()) {
    auto key_view =
        std::string_view{iterator->key().data(), iterator->key().size()};
    if (!key_view.starts_with(detail::kActivePrefix)) {
      break;
    }
    auto decoded = detail::decode_record<vigil::schema::transaction_t>(
        iterator->key(), iterator->value());
    if (decoded.has_value() && !decoded->reviewed) {
      transactions.push_back(std::move(*decoded));
    }
    iterator->Next();
  }
  detail::check_status(iterator->status(),
                       "Failed to scan unreviewed transactions");
  return transactions;
}

inline void storage<rocksdb_storage_tag>::put_transaction(
    const vigil::schema::transaction_t& transaction) const {
  ensure_open();
  auto encoder = detail::encoder_t{};
  auto encoded = encoder.encode(transaction);
  auto status = database->Put(
      ROCKSDB_NAMESPACE::WriteOptions{},
      detail::make_key(detail::kActivePrefix, transaction.id),
      detail::to_slice(encoded));
  detail::check_status(status, "Failed to put transaction into RocksDB");
}

inline std::optional<vigil::schema::transaction_t>
storage<rocksdb_storage_tag>::find_transaction(const std::string_view id) const {
  return find_by_key(detail::make_key(detail::kActivePrefix, id));
}

inline std::optional<vigil::schema::transaction_t>
storage<rocksdb_storage_tag>::find_archived(const std::string_view id) const {
  return find_by_key(detail::make_key(detail::kArchivePrefix, id));
}

inline void storage<rocksdb_storage_tag>::mark_reviewed(
    const std::vector<vigil::schema::transaction_id_t>& ids) const {
  ensure_open();
  auto encoder = detail::encoder_t{};
  auto batch = ROCKSDB_NAMESPACE::WriteBatch{};

  for (const auto& id : ids) {
    auto key = detail::make_key(detail::kActivePrefix, id);
    auto transaction = find_by_key(key);
    if (!transaction.has_value()) {
      spdlog::warn("Transaction '{}' is no longer active; not marking it", id);
      continue;
    }
    transaction->reviewed = true;
    auto encoded = encoder.encode(*transaction);
    detail::check_status(batch.Put(key, detail::to_slice(encoded)),
                         "Failed staging reviewed flag");
  }

  detail::check_status(
      database->Write(detail::durable_write_options(), &batch),
      "Failed to commit reviewed flags");
}

inline uint64_t storage<rocksdb_storage_tag>::move_to_archive(
    const vigil::schema::timestamp_milliseconds_t older_than) const {
  ensure_open();
  auto batch = ROCKSDB_NAMESPACE::WriteBatch{};
  auto moved = uint64_t{};

  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database->NewIterator(ROCKSDB_NAMESPACE::ReadOptions{})};
  iterator->Seek(std::string{detail::kActivePrefix});
  while (iterator->Valid()) {
    auto key_view =
        std::string_view{iterator->key().data(), iterator->key().size()};
    if (!key_view.starts_with(detail::kActivePrefix)) {
      break;
    }
    auto decoded = detail::decode_record<vigil::schema::transaction_t>(
        iterator->key(), iterator->value());
    if (decoded.has_value() && decoded->timestamp.has_value() &&
        *decoded->timestamp < older_than) {
      detail::check_status(
          batch.Put(detail::make_key(detail::kArchivePrefix, decoded->id),
                    iterator->value()),
          "Failed staging archive copy");
      detail::check_status(batch.Delete(iterator->key()),
                           "Failed staging active delete");
      ++moved;
    }
    iterator->Next();
  }
  detail::check_status(iterator->status(), "Failed to scan active transactions");

  if (moved == 0) {
    return 0;
  }
  detail::check_status(
      database->Write(detail::durable_write_options(), &batch),
      "Failed to commit archive move");
  return moved;
}

inline vigil::schema::alert_t storage<rocksdb_storage_tag>::insert_alert(
    vigil::schema::alert_t alert) const {
  ensure_open();
  auto encoder = detail::encoder_t{};

  auto next_id = vigil::schema::alert_id_t{1};
  auto raw_next = std::string{};
  auto status = database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                              std::string{detail::kNextAlertIdKey}, &raw_next);
  if (status.ok()) {
    auto decoded = encoder.try_decode<vigil::schema::alert_id_t>(
        vigil::schema::make_bytes_view(raw_next));
    if (!decoded.has_value()) {
      throw storage_unavailable{"corrupted alert id counter"};
    }
    next_id = *decoded;
  } else if (!status.IsNotFound()) {
    detail::check_status(status, "Failed to read alert id counter");
  }

  alert.id = next_id;
  auto encoded_alert = encoder.encode(alert);
  auto encoded_id = encoder.encode(alert.id);
  auto encoded_next = encoder.encode(vigil::schema::alert_id_t{next_id + 1});

  auto batch = ROCKSDB_NAMESPACE::WriteBatch{};
  detail::check_status(
      batch.Put(detail::make_alert_key(alert.id),
                detail::to_slice(encoded_alert)),
      "Failed staging alert");
  detail::check_status(
      batch.Put(detail::make_key(detail::kAlertByTransactionPrefix,
                                 alert.transaction_id),
                detail::to_slice(encoded_id)),
      "Failed staging alert index");
  detail::check_status(batch.Put(std::string{detail::kNextAlertIdKey},
                                 detail::to_slice(encoded_next)),
                       "Failed staging alert id counter");
  detail::check_status(
      database->Write(detail::durable_write_options(), &batch),
      "Failed to commit alert");
  return alert;
}

inline bool storage<rocksdb_storage_tag>::has_alert(
    const std::string_view transaction_id) const {
  ensure_open();
  auto value = std::string{};
  auto status = database->Get(
      ROCKSDB_NAMESPACE::ReadOptions{},
      detail::make_key(detail::kAlertByTransactionPrefix, transaction_id),
      &value);
  if (status.IsNotFound()) {
    return false;
  }
  detail::check_status(status, "Failed to read alert index");
  return true;
}

inline std::vector<vigil::schema::alert_t>
storage<rocksdb_storage_tag>::list_alerts(
    const vigil::schema::alert_id_t from_id,
    const std::size_t limit) const {
  ensure_open();
  auto alerts = std::vector<vigil::schema::alert_t>{};

  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database->NewIterator(ROCKSDB_NAMESPACE::ReadOptions{})};
  iterator->Seek(detail::make_alert_key(from_id));
  while (iterator->Valid() && alerts.size() < limit) {
    auto key_view =
        std::string_view{iterator->key().data(), iterator->key().size()};
    if (!key_view.starts_with(detail::kAlertPrefix)) {
      break;
    }
    auto decoded = detail::decode_record<vigil::schema::alert_t>(
        iterator->key(), iterator->value());
    if (decoded.has_value()) {
      alerts.push_back(std::move(*decoded));
    }
    iterator->Next();
  }
  detail::check_status(iterator->status(), "Failed to scan alerts");
  return alerts;
}

inline void storage<rocksdb_storage_tag>::close() {
  if (!database) {
    return;
  }
  auto status = database->Close();
  if (!status.ok()) {
    spdlog::warn("RocksDB close reported: {}", status.ToString());
  }
  database.reset();
  spdlog::info("RocksDB connection released");
}

}  // namespace vigil::storage
