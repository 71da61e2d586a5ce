#include <gtest/gtest.h>
#include <tally/execution/unit_of_work.hpp>
#include <tally/schema/tax_code.hpp>
#include <tally/testing/storage_fixture.hpp>

#include <string>

namespace {

tally::schema::bytes_t make_key(const std::string& text) {
  return tally::schema::make_bytes(text);
}

tally::schema::tax_code_t make_tax_code(const std::string& code,
                                        const uint32_t rate) {
  auto tax_code = tally::schema::tax_code_t{};
  tax_code.code = code;
  tax_code.rate_basis_points = rate;
  return tax_code;
}

}  // namespace

TEST(unit_of_work, staged_writes_are_visible_before_commit_only_to_the_unit) {
  auto fixture = tally::testing::storage_fixture{"tally_uow_staged"};
  auto work =
      tally::execution::unit_of_work{fixture.encoder(), fixture.storage()};
  work.put(make_key("T|GST"), make_tax_code("GST", 1500));

  EXPECT_TRUE(work.contains(make_key("T|GST")));
  EXPECT_EQ(work.staged_count(), 1u);
  EXPECT_FALSE(fixture.storage().get_raw(make_key("T|GST")).has_value());

  work.commit();
  auto stored = fixture.storage().get<tally::schema::tax_code_t>(
      fixture.encoder(), make_key("T|GST"));
  ASSERT_TRUE(stored.has_value());
  EXPECT_EQ(stored->rate_basis_points, 1500u);
}

TEST(unit_of_work, dropped_unit_discards_its_writes) {
  auto fixture = tally::testing::storage_fixture{"tally_uow_discard"};
  {
    auto work =
        tally::execution::unit_of_work{fixture.encoder(), fixture.storage()};
    work.put(make_key("T|GST"), make_tax_code("GST", 1500));
  }
  EXPECT_FALSE(fixture.storage().get_raw(make_key("T|GST")).has_value());
}

TEST(unit_of_work, list_overlays_staged_puts_and_deletes) {
  auto fixture = tally::testing::storage_fixture{"tally_uow_overlay"};
  {
    auto seed =
        tally::execution::unit_of_work{fixture.encoder(), fixture.storage()};
    seed.put(make_key("T|A"), make_tax_code("A", 100));
    seed.put(make_key("T|B"), make_tax_code("B", 200));
    seed.commit();
  }

  auto work =
      tally::execution::unit_of_work{fixture.encoder(), fixture.storage()};
  work.erase(make_key("T|A"));
  work.put(make_key("T|B"), make_tax_code("B", 250));
  work.put(make_key("T|C"), make_tax_code("C", 300));

  auto codes = work.list<tally::schema::tax_code_t>(make_key("T|"));
  ASSERT_EQ(codes.size(), 2u);
  EXPECT_EQ(codes[0].code, "B");
  EXPECT_EQ(codes[0].rate_basis_points, 250u);
  EXPECT_EQ(codes[1].code, "C");
  EXPECT_FALSE(work.contains(make_key("T|A")));

  work.commit();
  EXPECT_FALSE(fixture.storage().get_raw(make_key("T|A")).has_value());
  EXPECT_EQ(fixture.storage().list_by_prefix(make_key("T|")).size(), 2u);
}

TEST(unit_of_work, read_only_unit_reads_a_fixed_snapshot) {
  auto fixture = tally::testing::storage_fixture{"tally_uow_read_only"};
  {
    auto seed =
        tally::execution::unit_of_work{fixture.encoder(), fixture.storage()};
    seed.put(make_key("T|A"), make_tax_code("A", 100));
    seed.commit();
  }

  auto view = tally::execution::unit_of_work{
      fixture.encoder(), fixture.storage(),
      tally::execution::unit_of_work::read_only};
  EXPECT_TRUE(view.is_read_only());

  auto writer =
      tally::execution::unit_of_work{fixture.encoder(), fixture.storage()};
  writer.put(make_key("T|A"), make_tax_code("A", 900));
  writer.commit();

  auto seen = view.get<tally::schema::tax_code_t>(make_key("T|A"));
  ASSERT_TRUE(seen.has_value());
  EXPECT_EQ(seen->rate_basis_points, 100u);
}

TEST(unit_of_work, recorded_events_are_kept_in_order) {
  auto fixture = tally::testing::storage_fixture{"tally_uow_events"};
  auto work =
      tally::execution::unit_of_work{fixture.encoder(), fixture.storage()};
  auto first = tally::schema::audit_event_t{};
  first.message = "first";
  auto second = tally::schema::audit_event_t{};
  second.message = "second";
  work.record(first);
  work.record(second);
  ASSERT_EQ(work.events().size(), 2u);
  EXPECT_EQ(work.events()[0].message, "first");
  EXPECT_EQ(work.events()[1].message, "second");
}
