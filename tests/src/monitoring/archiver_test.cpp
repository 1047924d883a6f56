#include <gtest/gtest.h>
#include <vigil/monitoring/archiver.hpp>
#include <vigil/testing/common.hpp>
#include <vigil/testing/memory_storage.hpp>

using vigil::storage::memory_storage_tag;
using vigil::testing::days;
using vigil::testing::kBaseTime;
using vigil::testing::make_transaction;

namespace {

using memory_storage_t = vigil::storage::storage<memory_storage_tag>;

constexpr auto kNow = kBaseTime + days(60);

}  // namespace

TEST(archiver, moves_transactions_older_than_the_window) {
  auto storage = memory_storage_t{};
  storage.put_transaction(
      make_transaction("old", "a", "b", 1, kNow - days(31)));
  storage.put_transaction(
      make_transaction("recent", "a", "b", 1, kNow - days(29)));

  auto report = vigil::monitoring::archive_expired(storage, 30, kNow);
  EXPECT_FALSE(report.failed);
  EXPECT_EQ(report.moved, 1u);
  EXPECT_EQ(report.cutoff, kNow - days(30));
  EXPECT_TRUE(storage.find_archived("old").has_value());
  EXPECT_FALSE(storage.find_transaction("old").has_value());
  EXPECT_TRUE(storage.find_transaction("recent").has_value());
}

TEST(archiver, keeps_a_transaction_just_inside_the_window) {
  auto storage = memory_storage_t{};
  storage.put_transaction(
      make_transaction("edge", "a", "b", 1, kNow - days(30)));
  auto report = vigil::monitoring::archive_expired(storage, 30, kNow);
  EXPECT_EQ(report.moved, 0u);
  EXPECT_TRUE(storage.find_transaction("edge").has_value());
}

TEST(archiver, zero_retention_disables_archiving) {
  auto storage = memory_storage_t{};
  storage.put_transaction(make_transaction("ancient", "a", "b", 1, 0));
  storage.data->fail_archive = true;

  auto report = vigil::monitoring::archive_expired(storage, 0, kNow);
  EXPECT_FALSE(report.failed);
  EXPECT_EQ(report.moved, 0u);
  EXPECT_TRUE(storage.find_transaction("ancient").has_value());
}

TEST(archiver, undated_transactions_stay_active) {
  auto storage = memory_storage_t{};
  auto undated = make_transaction("undated", "a", "b", 1, 0);
  undated.timestamp.reset();
  storage.put_transaction(undated);
  auto report = vigil::monitoring::archive_expired(storage, 1, kNow);
  EXPECT_EQ(report.moved, 0u);
  EXPECT_TRUE(storage.find_transaction("undated").has_value());
}

TEST(archiver, failure_is_reported_and_leaves_data_in_place) {
  auto storage = memory_storage_t{};
  storage.put_transaction(
      make_transaction("old", "a", "b", 1, kNow - days(90)));
  storage.data->fail_archive = true;

  auto report = vigil::monitoring::archive_expired(storage, 30, kNow);
  EXPECT_TRUE(report.failed);
  EXPECT_EQ(report.moved, 0u);
  EXPECT_TRUE(storage.find_transaction("old").has_value());

  storage.data->fail_archive = false;
  EXPECT_EQ(vigil::monitoring::archive_expired(storage, 30, kNow).moved, 1u);
}
