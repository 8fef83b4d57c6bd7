#include <gtest/gtest.h>
#include <popchain/schema/primitives.hpp>

#include <string>
#include <string_view>

TEST(primitives, make_hash32_from_hex_string_decodes) {
  auto hash = popchain::schema::make_hash32(
      std::string_view{"0x0102030405060708090a0b0c0d0e0f10"
                       "1112131415161718191a1b1c1d1e1f20"});
  EXPECT_EQ(hash[0], 0x01);
  EXPECT_EQ(hash[31], 0x20);
}

TEST(primitives, try_make_hash32_rejects_short_input) {
  EXPECT_FALSE(popchain::schema::try_make_hash32("0xABCD").has_value());
}

TEST(primitives, short_address_is_left_padded) {
  auto address = popchain::schema::try_make_address("0xABC");
  ASSERT_TRUE(address.has_value());
  EXPECT_EQ((*address)[30], 0x0A);
  EXPECT_EQ((*address)[31], 0xBC);
  for (std::size_t i = 0; i < 30; ++i) {
    EXPECT_EQ((*address)[i], 0u);
  }
  EXPECT_EQ(popchain::schema::make_address("abc"), *address);
}

TEST(primitives, address_rejects_bad_input) {
  EXPECT_FALSE(popchain::schema::try_make_address("").has_value());
  EXPECT_FALSE(popchain::schema::try_make_address("0x").has_value());
  EXPECT_FALSE(popchain::schema::try_make_address("0xFEEG").has_value());
  EXPECT_FALSE(
      popchain::schema::try_make_address(std::string(66, 'a')).has_value());
}

TEST(primitives, hash_hex_carries_prefix) {
  auto address = popchain::schema::make_address("0xFEED");
  auto hex = popchain::schema::to_hex(address);
  EXPECT_EQ(hex.size(), 66u);
  EXPECT_TRUE(hex.starts_with("0x000000"));
  EXPECT_TRUE(hex.ends_with("feed"));
}

TEST(primitives, bytes_hex_round_trips) {
  auto payload = popchain::schema::bytes_t{0x00, 0x7F, 0x80, 0xFF};
  auto hex = popchain::schema::to_hex(
      popchain::schema::bytes_view_t{payload.data(), payload.size()});
  EXPECT_EQ(hex, "007f80ff");
  EXPECT_EQ(popchain::schema::from_hex(hex), payload);
  EXPECT_FALSE(popchain::schema::try_from_hex("abc").has_value());
}

TEST(primitives, utf8_validation_accepts_multibyte_text) {
  auto text = std::string{"PopM\xC3\xA9" "daille \xE2\x82\xAC \xF0\x9F\x8F\x86"};
  EXPECT_TRUE(popchain::schema::is_utf8(popchain::schema::make_bytes_view(text)));
  EXPECT_FALSE(
      popchain::schema::is_ascii(popchain::schema::make_bytes_view(text)));
}

TEST(primitives, utf8_validation_rejects_malformed_sequences) {
  auto truncated = popchain::schema::bytes_t{0x50, 0xC3};
  auto overlong = popchain::schema::bytes_t{0xC0, 0xAF};
  auto surrogate = popchain::schema::bytes_t{0xED, 0xA0, 0x80};
  auto stray = popchain::schema::bytes_t{0x80};
  EXPECT_FALSE(popchain::schema::is_utf8(truncated));
  EXPECT_FALSE(popchain::schema::is_utf8(overlong));
  EXPECT_FALSE(popchain::schema::is_utf8(surrogate));
  EXPECT_FALSE(popchain::schema::is_utf8(stray));
}

TEST(primitives, ascii_validation) {
  EXPECT_TRUE(popchain::schema::is_ascii(
      popchain::schema::make_bytes_view(std::string_view{"https://x.io/a"})));
  EXPECT_TRUE(popchain::schema::is_ascii(popchain::schema::bytes_t{}));
  EXPECT_FALSE(popchain::schema::is_ascii(popchain::schema::bytes_t{0xC3, 0xA9}));
}
