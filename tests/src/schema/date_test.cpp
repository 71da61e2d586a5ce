#include <gtest/gtest.h>
#include <tally/schema/date.hpp>

TEST(date, epoch_is_day_zero) {
  EXPECT_EQ(tally::schema::make_date(1970, 1, 1), 0);
  EXPECT_EQ(tally::schema::make_date(1969, 12, 31), -1);
}

TEST(date, iso_string_round_trips) {
  auto date = tally::schema::make_date(2024, 2, 29);
  EXPECT_EQ(tally::schema::to_iso_string(date), "2024-02-29");
  EXPECT_EQ(tally::schema::try_parse_date("2024-02-29"), date);
}

TEST(date, try_parse_date_rejects_invalid_text) {
  EXPECT_FALSE(tally::schema::try_parse_date("2023-02-29").has_value());
  EXPECT_FALSE(tally::schema::try_parse_date("2024-13-01").has_value());
  EXPECT_FALSE(tally::schema::try_parse_date("2024/01/01").has_value());
  EXPECT_FALSE(tally::schema::try_parse_date("24-01-01").has_value());
  EXPECT_FALSE(tally::schema::try_parse_date("2024-0a-01").has_value());
}

TEST(date, add_months_clamps_to_month_end) {
  using tally::schema::make_date;
  EXPECT_EQ(tally::schema::add_months(make_date(2024, 1, 31), 1),
            make_date(2024, 2, 29));
  EXPECT_EQ(tally::schema::add_months(make_date(2023, 1, 31), 1),
            make_date(2023, 2, 28));
  EXPECT_EQ(tally::schema::add_months(make_date(2024, 11, 15), 3),
            make_date(2025, 2, 15));
  EXPECT_EQ(tally::schema::add_months(make_date(2024, 3, 31), -1),
            make_date(2024, 2, 29));
}

TEST(date, date_of_truncates_timestamp_to_day) {
  auto day = tally::schema::make_date(2024, 5, 1);
  auto midday = static_cast<tally::schema::timestamp_milliseconds_t>(day) *
                    86'400'000ull +
                43'200'000ull;
  EXPECT_EQ(tally::schema::date_of(midday), day);
}
