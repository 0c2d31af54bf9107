#include <gtest/gtest.h>
#include <tally/schema/primitives.hpp>

TEST(primitives, make_hash32_from_bytes_round_trips) {
  auto input = tally::schema::bytes_t(32, 0xAB);
  auto hash = tally::schema::make_hash32(input);
  EXPECT_EQ(hash.size(), 32u);
  EXPECT_EQ(hash[0], 0xAB);
  EXPECT_EQ(hash[31], 0xAB);
}

TEST(primitives, make_hash32_from_hex_string_decodes) {
  auto hash = tally::schema::make_hash32(
      std::string_view{"0x0102030405060708090a0b0c0d0e0f10"
                       "1112131415161718191a1b1c1d1e1f20"});
  EXPECT_EQ(hash[0], 0x01);
  EXPECT_EQ(hash[31], 0x20);
}

TEST(primitives, try_make_hash32_rejects_short_input) {
  EXPECT_FALSE(tally::schema::try_make_hash32("0102").has_value());
  EXPECT_FALSE(tally::schema::try_make_hash32("zz").has_value());
}

TEST(primitives, hex_is_lowercase_and_reversible) {
  auto bytes = tally::schema::bytes_t{0x00, 0xAB, 0xFF};
  auto hex = tally::schema::to_hex(
      tally::schema::bytes_view_t{bytes.data(), bytes.size()});
  EXPECT_EQ(hex, "00abff");
  auto decoded = tally::schema::try_from_hex(hex);
  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(*decoded, bytes);
  EXPECT_FALSE(tally::schema::try_from_hex("abc").has_value());
}

TEST(primitives, base64_round_trips_bytes) {
  auto payload = tally::schema::bytes_t{0x01, 0x02, 0x03, 0xFE, 0xFF};
  auto encoded = tally::schema::to_base64(
      tally::schema::bytes_view_t{payload.data(), payload.size()});
  auto decoded = tally::schema::try_from_base64(encoded);
  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(*decoded, payload);
}

TEST(primitives, try_from_base64_rejects_invalid_input) {
  EXPECT_FALSE(tally::schema::try_from_base64("not base64***").has_value());
  EXPECT_FALSE(tally::schema::try_from_base64("QQ=A").has_value());
}

TEST(primitives, account_id_of_named_signer_is_its_identity) {
  auto named = tally::schema::named_signer_t{};
  named[0] = 0x42;
  EXPECT_EQ(tally::schema::to_account_id(tally::schema::signer_id_t{named}),
            named);
}

TEST(primitives, account_id_of_ed25519_signer_is_its_public_key) {
  auto signer = tally::schema::ed25519_signer_id{};
  signer.public_key[5] = 0x07;
  auto account = tally::schema::to_account_id(tally::schema::signer_id_t{signer});
  EXPECT_EQ(account[5], 0x07);
  EXPECT_EQ(account[0], 0x00);
}
