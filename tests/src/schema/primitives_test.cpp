#include <gtest/gtest.h>
#include <tally/schema/primitives.hpp>

TEST(primitives, try_make_hash32_accepts_prefixed_hex) {
  auto hash = tally::schema::try_make_hash32(
      std::string_view{"0x0102030405060708090a0b0c0d0e0f10"
                       "1112131415161718191A1B1C1D1E1F20"});
  ASSERT_TRUE(hash.has_value());
  EXPECT_EQ((*hash)[0], 0x01);
  EXPECT_EQ((*hash)[26], 0x1B);
  EXPECT_EQ((*hash)[31], 0x20);
}

TEST(primitives, try_make_hash32_rejects_wrong_length_and_bad_digits) {
  EXPECT_FALSE(tally::schema::try_make_hash32("0102").has_value());
  EXPECT_FALSE(tally::schema::try_make_hash32(std::string(64, 'z')).has_value());
  EXPECT_FALSE(tally::schema::try_make_hash32("acme").has_value());
}

TEST(primitives, to_hex_is_lowercase_and_padded) {
  auto bytes = tally::schema::bytes_t{0x00, 0xAB, 0x7F};
  EXPECT_EQ(tally::schema::to_hex(tally::schema::make_bytes_view(bytes)),
            "00ab7f");
  EXPECT_EQ(tally::schema::to_hex(tally::schema::bytes_view_t{}), "");
}

TEST(primitives, hex_round_trips_through_hash32) {
  auto text = std::string{};
  for (auto i = 0; i < 32; ++i) {
    text += "c3";
  }
  auto hash = tally::schema::try_make_hash32(text);
  ASSERT_TRUE(hash.has_value());
  EXPECT_EQ(tally::schema::to_hex(
                tally::schema::bytes_view_t{hash->data(), hash->size()}),
            text);
}

TEST(primitives, format_amount_renders_minor_units) {
  EXPECT_EQ(tally::schema::format_amount(0), "0.00");
  EXPECT_EQ(tally::schema::format_amount(11500), "115.00");
  EXPECT_EQ(tally::schema::format_amount(7), "0.07");
  EXPECT_EQ(tally::schema::format_amount(-105), "-1.05");
}

TEST(primitives, make_bytes_copies_text) {
  auto bytes = tally::schema::make_bytes(std::string_view{"ledger"});
  ASSERT_EQ(bytes.size(), 6u);
  EXPECT_EQ(bytes.front(), 'l');
  EXPECT_EQ(tally::schema::make_bytes(tally::schema::make_bytes_view(bytes)),
            bytes);
}
