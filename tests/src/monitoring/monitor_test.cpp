#include <gtest/gtest.h>
#include <spdlog/sinks/ostream_sink.h>
#include <spdlog/spdlog.h>
#include <vigil/detection/policy.hpp>
#include <vigil/monitoring/monitor.hpp>
#include <vigil/testing/common.hpp>
#include <vigil/testing/memory_storage.hpp>

#include <memory>
#include <sstream>
#include <string>
#include <vector>

using vigil::schema::alert_type_t;
using vigil::schema::risk_band_t;
using vigil::storage::memory_storage_tag;
using vigil::testing::kBaseTime;
using vigil::testing::make_transaction;

namespace {

using memory_storage_t = vigil::storage::storage<memory_storage_tag>;
using monitor_t = vigil::monitoring::monitor<memory_storage_tag>;

vigil::schema::timestamp_milliseconds_t fixed_now() {
  return kBaseTime + vigil::testing::days(1);
}

vigil::detection::detection_policy make_policy() {
  auto policy = vigil::detection::detection_policy{};
  policy.rules = {alert_type_t::high_value,
                  alert_type_t::high_risk_counterparty,
                  alert_type_t::cluster_member};
  policy.threshold = vigil::schema::make_amount(10'000);
  policy.risk_list = {"mule"};
  policy.graph_node_limit = 100;
  policy.cluster_size_limit = 5;
  policy.scoring = vigil::detection::make_default_scoring_policy();
  return policy;
}

void seed(const memory_storage_t& storage) {
  storage.put_transaction(make_transaction("big", "a", "b", 20'000, kBaseTime));
  storage.put_transaction(
      make_transaction("both", "mule", "c", 15'000, kBaseTime));
  storage.put_transaction(make_transaction("quiet", "d", "e", 10, kBaseTime));
}

}  // namespace

TEST(monitor, records_one_scored_alert_per_flagged_transaction) {
  auto storage = memory_storage_t{};
  seed(storage);
  auto monitor = monitor_t{storage, make_policy(), fixed_now};

  auto report = monitor.run_pass(1);
  EXPECT_EQ(report.fetched, 3u);
  EXPECT_EQ(report.flagged, 2u);
  EXPECT_EQ(report.alerts_recorded, 2u);
  EXPECT_TRUE(report.marked);

  auto big = storage.alerts_for("big");
  ASSERT_EQ(big.size(), 1u);
  EXPECT_EQ(big[0].alert_types,
            (std::vector<alert_type_t>{alert_type_t::high_value}));
  EXPECT_EQ(big[0].risk_score, 30u);
  EXPECT_EQ(big[0].risk_band, risk_band_t::moderate);
  EXPECT_EQ(big[0].pass_id, 1u);
  EXPECT_EQ(big[0].created_at, fixed_now());

  auto both = storage.alerts_for("both");
  ASSERT_EQ(both.size(), 1u);
  EXPECT_EQ(both[0].alert_types,
            (std::vector<alert_type_t>{alert_type_t::high_value,
                                       alert_type_t::high_risk_counterparty}));
  EXPECT_EQ(both[0].risk_score, 80u);
  EXPECT_EQ(both[0].risk_band, risk_band_t::high);

  EXPECT_TRUE(storage.alerts_for("quiet").empty());
}

TEST(monitor, marks_every_fetched_transaction_exactly_once) {
  auto storage = memory_storage_t{};
  seed(storage);
  auto monitor = monitor_t{storage, make_policy(), fixed_now};

  monitor.run_pass(1);
  ASSERT_EQ(storage.data->mark_calls.size(), 1u);
  EXPECT_EQ(storage.data->mark_calls[0].size(), 3u);
  for (const auto& id : {"big", "both", "quiet"}) {
    EXPECT_EQ(storage.data->review_count[id], 1u) << id;
  }

  auto second = monitor.run_pass(2);
  EXPECT_EQ(second.fetched, 0u);
  EXPECT_EQ(second.flagged, 0u);
  EXPECT_EQ(storage.data->mark_calls.size(), 1u);
  EXPECT_EQ(storage.data->alerts.size(), 2u);
}

TEST(monitor, only_new_transactions_are_evaluated_on_later_passes) {
  auto storage = memory_storage_t{};
  seed(storage);
  auto monitor = monitor_t{storage, make_policy(), fixed_now};
  monitor.run_pass(1);

  storage.put_transaction(
      make_transaction("late", "f", "g", 50'000, kBaseTime));
  auto report = monitor.run_pass(2);
  EXPECT_EQ(report.fetched, 1u);
  EXPECT_EQ(report.alerts_recorded, 1u);
  ASSERT_EQ(storage.alerts_for("late").size(), 1u);
  EXPECT_EQ(storage.alerts_for("late")[0].pass_id, 2u);
  EXPECT_EQ(storage.alerts_for("big").size(), 1u);
}

TEST(monitor, alert_failure_does_not_block_marking) {
  auto storage = memory_storage_t{};
  seed(storage);
  storage.data->fail_alert_for.insert("big");
  auto monitor = monitor_t{storage, make_policy(), fixed_now};

  auto report = monitor.run_pass(1);
  EXPECT_EQ(report.alert_failures, 1u);
  EXPECT_EQ(report.alerts_recorded, 1u);
  EXPECT_TRUE(report.marked);
  EXPECT_TRUE(storage.alerts_for("big").empty());
  EXPECT_EQ(storage.alerts_for("both").size(), 1u);
  EXPECT_EQ(storage.data->review_count["big"], 1u);
}

TEST(monitor, fetch_failure_propagates_without_side_effects) {
  auto storage = memory_storage_t{};
  seed(storage);
  storage.data->fail_fetch = true;
  auto monitor = monitor_t{storage, make_policy(), fixed_now};

  EXPECT_THROW(monitor.run_pass(1), vigil::storage::storage_unavailable);
  EXPECT_TRUE(storage.data->alerts.empty());
  EXPECT_TRUE(storage.data->mark_calls.empty());
}

TEST(monitor, retry_after_mark_failure_does_not_duplicate_alerts) {
  auto storage = memory_storage_t{};
  seed(storage);
  storage.data->fail_mark = true;
  auto monitor = monitor_t{storage, make_policy(), fixed_now};

  EXPECT_THROW(monitor.run_pass(1), vigil::storage::storage_unavailable);
  EXPECT_EQ(storage.data->alerts.size(), 2u);
  EXPECT_TRUE(storage.data->review_count.empty());

  storage.data->fail_mark = false;
  auto retry = monitor.run_pass(2);
  EXPECT_EQ(retry.fetched, 3u);
  EXPECT_EQ(retry.alerts_recorded, 0u);
  EXPECT_EQ(retry.alerts_skipped, 2u);
  EXPECT_TRUE(retry.marked);
  EXPECT_EQ(storage.data->alerts.size(), 2u);
  EXPECT_EQ(storage.data->review_count["quiet"], 1u);
}

TEST(monitor, retry_logs_tags_it_does_not_record) {
  auto storage = memory_storage_t{};
  seed(storage);
  storage.data->fail_mark = true;
  auto monitor = monitor_t{storage, make_policy(), fixed_now};
  EXPECT_THROW(monitor.run_pass(1), vigil::storage::storage_unavailable);

  // The grown batch puts 'big' (a -> b) inside a six entity cluster.
  for (auto i = 0; i < 4; ++i) {
    auto from = i == 0 ? std::string{"b"} : "x" + std::to_string(i);
    storage.put_transaction(make_transaction("hop" + std::to_string(i), from,
                                             "x" + std::to_string(i + 1), 10,
                                             kBaseTime));
  }
  storage.data->fail_mark = false;

  auto log = std::ostringstream{};
  auto previous = spdlog::default_logger();
  spdlog::set_default_logger(std::make_shared<spdlog::logger>(
      "monitor_test", std::make_shared<spdlog::sinks::ostream_sink_mt>(log)));
  auto retry = monitor.run_pass(2);
  spdlog::set_default_logger(previous);

  EXPECT_EQ(retry.alerts_skipped, 2u);
  auto big = storage.alerts_for("big");
  ASSERT_EQ(big.size(), 1u);
  EXPECT_EQ(big[0].alert_types,
            (std::vector<alert_type_t>{alert_type_t::high_value}));
  EXPECT_NE(log.str().find("'big' already recorded; not recording "
                           "[high_value,cluster_member] score 50"),
            std::string::npos)
      << log.str();
}

TEST(monitor, cluster_membership_adds_to_the_score) {
  auto storage = memory_storage_t{};
  for (auto i = 0; i < 5; ++i) {
    storage.put_transaction(make_transaction(
        "ring" + std::to_string(i), "e" + std::to_string(i),
        "e" + std::to_string(i + 1), i == 0 ? 20'000 : 100, kBaseTime));
  }
  auto monitor = monitor_t{storage, make_policy(), fixed_now};

  auto report = monitor.run_pass(1);
  EXPECT_EQ(report.flagged, 5u);

  auto lead = storage.alerts_for("ring0");
  ASSERT_EQ(lead.size(), 1u);
  EXPECT_EQ(lead[0].alert_types,
            (std::vector<alert_type_t>{alert_type_t::high_value,
                                       alert_type_t::cluster_member}));
  EXPECT_EQ(lead[0].risk_score, 50u);

  auto member = storage.alerts_for("ring3");
  ASSERT_EQ(member.size(), 1u);
  EXPECT_EQ(member[0].risk_score, 20u);
  EXPECT_EQ(member[0].risk_band, risk_band_t::moderate);
}

TEST(monitor, malformed_rows_are_evaluated_and_marked) {
  auto storage = memory_storage_t{};
  auto partial = make_transaction("partial", "a", "b", 20'000, kBaseTime);
  partial.timestamp.reset();
  partial.destination.reset();
  storage.put_transaction(partial);
  auto monitor = monitor_t{storage, make_policy(), fixed_now};

  auto report = monitor.run_pass(1);
  EXPECT_EQ(report.warnings, 2u);
  EXPECT_EQ(report.alerts_recorded, 1u);
  EXPECT_EQ(storage.data->review_count["partial"], 1u);
}
