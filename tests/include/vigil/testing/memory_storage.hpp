#pragma once

#include <vigil/storage/storage.hpp>

#include <iterator>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace vigil::storage {

struct memory_storage_tag {};

/// In-process backend for pipeline tests. The state lives behind a shared
/// pointer so a test keeps access after the storage is moved into a loop.
template <>
struct storage<memory_storage_tag> final {
  struct state final {
    std::map<vigil::schema::transaction_id_t, vigil::schema::transaction_t>
        active;
    std::map<vigil::schema::transaction_id_t, vigil::schema::transaction_t>
        archive;
    std::map<vigil::schema::alert_id_t, vigil::schema::alert_t> alerts;
    vigil::schema::alert_id_t next_alert_id{1};
    bool open{true};

    bool fail_fetch{false};
    bool fail_mark{false};
    bool fail_archive{false};
    std::set<vigil::schema::transaction_id_t> fail_alert_for;

    uint64_t fetch_calls{};
    std::vector<std::vector<vigil::schema::transaction_id_t>> mark_calls;
    std::map<vigil::schema::transaction_id_t, uint64_t> review_count;
  };

  std::shared_ptr<state> data{std::make_shared<state>()};

  std::vector<vigil::schema::transaction_t> fetch_unreviewed() const {
    ensure_open();
    ++data->fetch_calls;
    if (data->fail_fetch) {
      throw storage_unavailable{"injected fetch failure"};
    }
    auto out = std::vector<vigil::schema::transaction_t>{};
    for (const auto& [id, tx] : data->active) {
      if (!tx.reviewed) {
        out.push_back(tx);
      }
    }
    return out;
  }

  void put_transaction(const vigil::schema::transaction_t& transaction) const {
    ensure_open();
    data->active[transaction.id] = transaction;
  }

  std::optional<vigil::schema::transaction_t> find_transaction(
      const std::string_view id) const {
    ensure_open();
    return find_in(data->active, id);
  }

  std::optional<vigil::schema::transaction_t> find_archived(
      const std::string_view id) const {
    ensure_open();
    return find_in(data->archive, id);
  }

  void mark_reviewed(
      const std::vector<vigil::schema::transaction_id_t>& ids) const {
    ensure_open();
    data->mark_calls.push_back(ids);
    if (data->fail_mark) {
      throw storage_unavailable{"injected mark failure"};
    }
    for (const auto& id : ids) {
      auto it = data->active.find(id);
      if (it != std::end(data->active)) {
        it->second.reviewed = true;
        ++data->review_count[id];
      }
    }
  }

  uint64_t move_to_archive(
      const vigil::schema::timestamp_milliseconds_t older_than) const {
    ensure_open();
    if (data->fail_archive) {
      throw storage_unavailable{"injected archive failure"};
    }
    auto moved = uint64_t{};
    for (auto it = std::begin(data->active); it != std::end(data->active);) {
      if (it->second.timestamp.has_value() &&
          *it->second.timestamp < older_than) {
        data->archive[it->first] = it->second;
        it = data->active.erase(it);
        ++moved;
      } else {
        ++it;
      }
    }
    return moved;
  }

  vigil::schema::alert_t insert_alert(vigil::schema::alert_t alert) const {
    ensure_open();
    if (data->fail_alert_for.contains(alert.transaction_id)) {
      throw storage_unavailable{"injected alert failure"};
    }
    alert.id = data->next_alert_id++;
    data->alerts[alert.id] = alert;
    return alert;
  }

  bool has_alert(const std::string_view transaction_id) const {
    ensure_open();
    for (const auto& [id, alert] : data->alerts) {
      if (alert.transaction_id == transaction_id) {
        return true;
      }
    }
    return false;
  }

  std::vector<vigil::schema::alert_t> list_alerts(
      const vigil::schema::alert_id_t from_id,
      const std::size_t limit) const {
    ensure_open();
    auto out = std::vector<vigil::schema::alert_t>{};
    for (auto it = data->alerts.lower_bound(from_id);
         it != std::end(data->alerts) && out.size() < limit; ++it) {
      out.push_back(it->second);
    }
    return out;
  }

  void close() { data->open = false; }

  std::vector<vigil::schema::alert_t> alerts_for(
      const std::string_view transaction_id) const {
    auto out = std::vector<vigil::schema::alert_t>{};
    for (const auto& [id, alert] : data->alerts) {
      if (alert.transaction_id == transaction_id) {
        out.push_back(alert);
      }
    }
    return out;
  }

 private:
  void ensure_open() const {
    if (!data->open) {
      throw storage_unavailable{"memory storage is closed"};
    }
  }

  static std::optional<vigil::schema::transaction_t> find_in(
      const std::map<vigil::schema::transaction_id_t,
                     vigil::schema::transaction_t>& records,
      const std::string_view id) {
    auto it = records.find(std::string{id});
    if (it == std::end(records)) {
      return std::nullopt;
    }
    return it->second;
  }
};

}  // namespace vigil::storage
