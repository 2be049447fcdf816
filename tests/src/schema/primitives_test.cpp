#include <gtest/gtest.h>
#include <courier/schema/primitives.hpp>
#include <courier/schema/selector.hpp>

#include <limits>

TEST(primitives, make_hash32_from_hex_string_decodes) {
  auto hash = courier::schema::make_hash32(
      std::string_view{"0x0102030405060708090a0b0c0d0e0f10"
                       "1112131415161718191a1b1c1d1e1f20"});
  EXPECT_EQ(hash[0], 0x01);
  EXPECT_EQ(hash[31], 0x20);
}

TEST(primitives, make_zero_hash_returns_zero_bytes) {
  auto zero = courier::schema::make_zero_hash();
  for (auto byte : zero) {
    EXPECT_EQ(byte, 0u);
  }
}

TEST(primitives, address_parsing_is_case_insensitive) {
  auto mixed = courier::schema::try_make_address(
      "0x833589fCD6eDb6E08f4c7C32D4f71b54bdA02913");
  auto lower = courier::schema::try_make_address(
      "833589fcd6edb6e08f4c7c32d4f71b54bda02913");
  ASSERT_TRUE(mixed.has_value());
  ASSERT_TRUE(lower.has_value());
  EXPECT_EQ(*mixed, *lower);
  EXPECT_EQ(courier::schema::to_string(*mixed),
            "0x833589fcd6edb6e08f4c7c32d4f71b54bda02913");
}

TEST(primitives, address_parsing_rejects_wrong_length) {
  EXPECT_FALSE(courier::schema::try_make_address("0xdeadbeef").has_value());
  EXPECT_FALSE(courier::schema::try_make_address(
                   "0xdeadbeefdeadbeefdeadbeefdeadbeefdeadbeef00")
                   .has_value());
  EXPECT_FALSE(courier::schema::try_make_address(
                   "0xzzadbeefdeadbeefdeadbeefdeadbeefdeadbeef")
                   .has_value());
}

TEST(primitives, amount_parses_decimal_and_hex) {
  EXPECT_EQ(courier::schema::try_make_amount("1000000"),
            courier::schema::amount_t{1000000});
  EXPECT_EQ(courier::schema::try_make_amount("0x0f4240"),
            courier::schema::amount_t{1000000});
  EXPECT_EQ(courier::schema::try_make_amount("0"),
            courier::schema::amount_t{0});
}

TEST(primitives, amount_rejects_garbage_and_overflow) {
  EXPECT_FALSE(courier::schema::try_make_amount("").has_value());
  EXPECT_FALSE(courier::schema::try_make_amount("0x").has_value());
  EXPECT_FALSE(courier::schema::try_make_amount("12a").has_value());
  EXPECT_FALSE(courier::schema::try_make_amount("-1").has_value());

  auto max = std::numeric_limits<courier::schema::amount_t>::max();
  auto text = courier::schema::to_string(max);
  EXPECT_EQ(courier::schema::try_make_amount(text), max);
  text.back() = static_cast<char>(text.back() + 1);
  EXPECT_FALSE(courier::schema::try_make_amount(text).has_value());
  EXPECT_FALSE(courier::schema::try_make_amount(
                   "0x1" + std::string(64, '0'))
                   .has_value());
}

TEST(primitives, hex_quantity_has_no_leading_zeros) {
  EXPECT_EQ(courier::schema::to_hex_quantity(0), "0x0");
  EXPECT_EQ(courier::schema::to_hex_quantity(255), "0xff");
  EXPECT_EQ(courier::schema::to_hex_quantity(123456789), "0x75bcd15");
}

TEST(primitives, hex_round_trips_bytes) {
  auto bytes = courier::schema::bytes_t{0x00, 0x01, 0xab, 0xff};
  EXPECT_EQ(courier::schema::to_0x_hex(bytes), "0x0001abff");
  EXPECT_EQ(courier::schema::from_hex("0x0001ABFF"), bytes);
  EXPECT_EQ(courier::schema::from_hex(""), courier::schema::bytes_t{});
  EXPECT_FALSE(courier::schema::try_from_hex("0x123").has_value());
}

TEST(selector, selector_of_reads_leading_bytes) {
  auto data = courier::schema::bytes_t{0xc7, 0xc7, 0xf5, 0xb3, 0x00};
  auto selector = courier::schema::selector_of(data);
  ASSERT_TRUE(selector.has_value());
  EXPECT_EQ(*selector, courier::schema::kTransferSelector);
  EXPECT_EQ(courier::schema::to_string(*selector), "0xc7c7f5b3");
}

TEST(selector, selector_of_short_input_is_empty) {
  auto data = courier::schema::bytes_t{0x09, 0x5e, 0xa7};
  EXPECT_FALSE(courier::schema::selector_of(data).has_value());
}
