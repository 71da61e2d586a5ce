#include <gtest/gtest.h>
#include <tally/schema/account.hpp>
#include <tally/testing/storage_fixture.hpp>

#include <string>

namespace {

tally::schema::bytes_t make_key(const std::string& text) {
  return tally::schema::make_bytes(text);
}

}  // namespace

TEST(storage, put_then_get_round_trips_encoded_value) {
  auto fixture = tally::testing::storage_fixture{"tally_storage_put"};
  auto account = tally::schema::account_t{};
  account.code = "1000";
  account.name = "Bank";
  account.is_bank = true;
  account.security_level = 3;

  auto key = make_key("STATE|ACCOUNT|a");
  fixture.storage().put(fixture.encoder(), key, account);
  auto loaded = fixture.storage().get<tally::schema::account_t>(
      fixture.encoder(), key);
  ASSERT_TRUE(loaded.has_value());
  EXPECT_EQ(loaded->code, "1000");
  EXPECT_EQ(loaded->name, "Bank");
  EXPECT_TRUE(loaded->is_bank);
  EXPECT_EQ(loaded->security_level, std::optional<uint32_t>{3});

  EXPECT_FALSE(fixture.storage()
                   .get<tally::schema::account_t>(fixture.encoder(),
                                                  make_key("missing"))
                   .has_value());
}

TEST(storage, list_by_prefix_returns_matching_keys_in_order) {
  auto fixture = tally::testing::storage_fixture{"tally_storage_prefix"};
  auto batch = tally::storage::write_batch{};
  batch.puts.push_back({make_key("P|b"), make_key("2")});
  batch.puts.push_back({make_key("P|a"), make_key("1")});
  batch.puts.push_back({make_key("Q|a"), make_key("3")});
  fixture.storage().apply(batch);

  auto rows = fixture.storage().list_by_prefix(make_key("P|"));
  ASSERT_EQ(rows.size(), 2u);
  EXPECT_EQ(rows[0].first, make_key("P|a"));
  EXPECT_EQ(rows[1].first, make_key("P|b"));
  EXPECT_EQ(rows[1].second, make_key("2"));
}

TEST(storage, apply_handles_puts_and_deletes_together) {
  auto fixture = tally::testing::storage_fixture{"tally_storage_batch"};
  auto first = tally::storage::write_batch{};
  first.puts.push_back({make_key("K|1"), make_key("one")});
  first.puts.push_back({make_key("K|2"), make_key("two")});
  fixture.storage().apply(first);

  auto second = tally::storage::write_batch{};
  second.deletes.push_back(make_key("K|1"));
  second.puts.push_back({make_key("K|3"), make_key("three")});
  fixture.storage().apply(second);

  EXPECT_FALSE(fixture.storage().get_raw(make_key("K|1")).has_value());
  EXPECT_EQ(fixture.storage().get_raw(make_key("K|3")), make_key("three"));
  EXPECT_EQ(fixture.storage().list_by_prefix(make_key("K|")).size(), 2u);
}

TEST(storage, snapshot_does_not_see_later_writes) {
  auto fixture = tally::testing::storage_fixture{"tally_storage_snapshot"};
  auto batch = tally::storage::write_batch{};
  batch.puts.push_back({make_key("S|1"), make_key("before")});
  fixture.storage().apply(batch);

  auto snapshot = fixture.storage().snapshot();

  auto later = tally::storage::write_batch{};
  later.puts.push_back({make_key("S|1"), make_key("after")});
  later.puts.push_back({make_key("S|2"), make_key("new")});
  fixture.storage().apply(later);

  EXPECT_EQ(fixture.storage().get_raw(make_key("S|1"), &snapshot),
            make_key("before"));
  EXPECT_EQ(fixture.storage().list_by_prefix(make_key("S|"), &snapshot).size(),
            1u);
  EXPECT_EQ(fixture.storage().get_raw(make_key("S|1")), make_key("after"));
}
