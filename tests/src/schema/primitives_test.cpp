#include <gtest/gtest.h>
#include <waybill/schema/primitives.hpp>

#include <string>
#include <string_view>

TEST(primitives, try_make_hash32_accepts_exactly_32_bytes) {
  auto input = waybill::schema::bytes_t(32, 0xAB);
  auto hash = waybill::schema::try_make_hash32(input);
  ASSERT_TRUE(hash.has_value());
  EXPECT_EQ((*hash)[0], 0xAB);
  EXPECT_EQ((*hash)[31], 0xAB);
}

TEST(primitives, try_make_hash32_rejects_other_lengths) {
  auto short_input = waybill::schema::bytes_t(31, 0x01);
  auto long_input = waybill::schema::bytes_t(33, 0x01);
  auto empty_input = waybill::schema::bytes_t{};
  EXPECT_FALSE(waybill::schema::try_make_hash32(short_input).has_value());
  EXPECT_FALSE(waybill::schema::try_make_hash32(long_input).has_value());
  EXPECT_FALSE(waybill::schema::try_make_hash32(empty_input).has_value());
}

TEST(primitives, string_and_bytes_conversions_preserve_content) {
  auto text = std::string{"in-transit"};
  auto bytes = waybill::schema::make_bytes(text);
  EXPECT_EQ(bytes.size(), text.size());
  EXPECT_EQ(waybill::schema::make_string(bytes), text);
  EXPECT_EQ(waybill::schema::make_string(
                waybill::schema::make_bytes_view(bytes)),
            text);
}
