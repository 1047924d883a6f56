#include <gtest/gtest.h>
#include <vigil/detection/pipeline.hpp>
#include <vigil/testing/common.hpp>

#include <vector>

using vigil::detection::batch_t;
using vigil::detection::flagged_set_t;
using vigil::detection::rule;
using vigil::schema::alert_type_t;
using vigil::testing::kBaseTime;
using vigil::testing::make_transaction;

namespace {

rule make_fixed_rule(const alert_type_t type, flagged_set_t ids) {
  return rule{.type = type, .evaluate = [ids](const batch_t&) { return ids; }};
}

}  // namespace

TEST(pipeline, unions_rule_outputs_in_batch_order) {
  auto batch = batch_t{make_transaction("t1", "a", "b", 1, kBaseTime),
                       make_transaction("t2", "a", "b", 1, kBaseTime),
                       make_transaction("t3", "a", "b", 1, kBaseTime)};
  auto rules = std::vector<rule>{
      make_fixed_rule(alert_type_t::high_value, {"t3", "t1"}),
      make_fixed_rule(alert_type_t::round_amount, {"t1"})};

  auto flagged = vigil::detection::run_rules(batch, rules);
  ASSERT_EQ(flagged.size(), 2u);
  EXPECT_EQ(flagged[0].id, "t1");
  EXPECT_EQ(flagged[0].alert_types,
            (std::vector<alert_type_t>{alert_type_t::high_value,
                                       alert_type_t::round_amount}));
  EXPECT_EQ(flagged[1].id, "t3");
  EXPECT_EQ(flagged[1].alert_types,
            (std::vector<alert_type_t>{alert_type_t::high_value}));
}

TEST(pipeline, every_rule_sees_the_whole_batch) {
  auto batch = batch_t{make_transaction("t1", "a", "b", 1, kBaseTime),
                       make_transaction("t2", "a", "b", 1, kBaseTime)};
  auto seen = std::vector<std::size_t>{};
  auto counting = [&](const alert_type_t type) {
    return rule{.type = type, .evaluate = [&seen](const batch_t& snapshot) {
                  seen.push_back(snapshot.size());
                  return flagged_set_t{};
                }};
  };
  auto rules = std::vector<rule>{counting(alert_type_t::high_value),
                                 counting(alert_type_t::new_counterparty)};

  EXPECT_TRUE(vigil::detection::run_rules(batch, rules).empty());
  EXPECT_EQ(seen, (std::vector<std::size_t>{2, 2}));
}

TEST(pipeline, duplicate_rule_tags_are_reported_once) {
  auto batch = batch_t{make_transaction("t1", "a", "b", 1, kBaseTime)};
  auto rules = std::vector<rule>{
      make_fixed_rule(alert_type_t::high_value, {"t1"}),
      make_fixed_rule(alert_type_t::high_value, {"t1"})};
  auto flagged = vigil::detection::run_rules(batch, rules);
  ASSERT_EQ(flagged.size(), 1u);
  EXPECT_EQ(flagged[0].alert_types.size(), 1u);
}

TEST(pipeline, empty_rule_table_flags_nothing) {
  auto batch = batch_t{make_transaction("t1", "a", "b", 1, kBaseTime)};
  EXPECT_TRUE(vigil::detection::run_rules(batch, {}).empty());
}
