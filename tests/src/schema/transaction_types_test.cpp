#include <gtest/gtest.h>
#include <tally/schema/capability.hpp>
#include <tally/schema/encoding/scale/encoder.hpp>
#include <tally/schema/ledger_event_type.hpp>
#include <tally/schema/stake_state.hpp>
#include <tally/schema/stake_status.hpp>
#include <tally/schema/transaction.hpp>
#include <tally/schema/transaction_error_code.hpp>
#include <tally/testing/common.hpp>

#include <algorithm>

using tally::testing::make_hash;

namespace {

using encoder_t = tally::schema::encoding::encoder<
    tally::schema::encoding::scale_encoder_tag>;

}  // namespace

TEST(transaction_types, defaults_are_stable) {
  auto tx = tally::schema::transaction_t{};
  EXPECT_EQ(tx.version, 1u);
  EXPECT_EQ(tx.nonce, 0u);

  auto stake = tally::schema::stake_state_t{};
  EXPECT_EQ(stake.status, tally::schema::stake_status_t::active);
  EXPECT_FALSE(stake.closed_epoch.has_value());
}

TEST(transaction_types, payload_variant_holds_valid_type) {
  auto tx = tally::schema::transaction_t{};
  tx.payload = tally::schema::open_stake_t{.vault_id = make_hash(1),
                                           .asset_id = make_hash(2),
                                           .principal = 100,
                                           .lock_epochs = 3};
  EXPECT_TRUE(std::holds_alternative<tally::schema::open_stake_t>(tx.payload));
}

TEST(transaction_types, envelope_survives_scale_encoding) {
  auto tx = tally::schema::transaction_t{
      .chain_id = make_hash(7),
      .nonce = 4,
      .signer = tally::schema::signer_id_t{make_hash(9)},
      .payload = tally::schema::close_stake_t{.stake_id = make_hash(3),
                                              .recipient = make_hash(5)}};
  auto encoder = encoder_t{};
  auto encoded = encoder.encode(tx);
  auto decoded = encoder.try_decode<tally::schema::transaction_t>(
      tally::schema::bytes_view_t{encoded.data(), encoded.size()});
  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(decoded->nonce, 4u);
  EXPECT_EQ(decoded->chain_id, make_hash(7));
  ASSERT_TRUE(std::holds_alternative<tally::schema::close_stake_t>(decoded->payload));
  const auto& payload = std::get<tally::schema::close_stake_t>(decoded->payload);
  EXPECT_EQ(payload.stake_id, make_hash(3));
  ASSERT_TRUE(payload.recipient.has_value());
  EXPECT_EQ(*payload.recipient, make_hash(5));
}

TEST(transaction_types, truncated_envelope_fails_to_decode) {
  auto tx = tally::schema::transaction_t{
      .payload = tally::schema::deposit_t{.vault_id = make_hash(1),
                                          .asset_id = make_hash(2),
                                          .amount = 10}};
  auto encoder = encoder_t{};
  auto encoded = encoder.encode(tx);
  encoded.resize(encoded.size() / 2);
  EXPECT_FALSE(encoder
                   .try_decode<tally::schema::transaction_t>(
                       tally::schema::bytes_view_t{encoded.data(),
                                                   encoded.size()})
                   .has_value());
}

TEST(transaction_types, out_of_range_enum_values_fail_to_decode) {
  auto payload = tally::schema::upsert_capability_t{
      .subject = make_hash(0x44),
      .capability = tally::schema::capability_t::governance,
      .enabled = true};
  auto tx = tally::schema::transaction_t{.chain_id = make_hash(7),
                                         .nonce = 1,
                                         .signer = tally::schema::signer_id_t{
                                             make_hash(9)},
                                         .payload = payload};
  auto encoder = encoder_t{};
  auto encoded = encoder.encode(tx);
  auto encoded_payload = encoder.encode(payload);
  auto found = std::search(std::begin(encoded), std::end(encoded),
                           std::begin(encoded_payload),
                           std::end(encoded_payload));
  ASSERT_NE(found, std::end(encoded));

  // version (2 bytes) and subject (32 bytes) precede the capability byte.
  auto capability_byte = found + 2 + 32;
  ASSERT_EQ(*capability_byte, 0u);
  ASSERT_TRUE(encoder
                  .try_decode<tally::schema::transaction_t>(
                      tally::schema::bytes_view_t{encoded.data(),
                                                  encoded.size()})
                  .has_value());

  *capability_byte = 7;
  EXPECT_FALSE(encoder
                   .try_decode<tally::schema::transaction_t>(
                       tally::schema::bytes_view_t{encoded.data(),
                                                   encoded.size()})
                   .has_value());

  // version, three ids and five 64-bit fields precede the status byte; an
  // absent closed_epoch is one trailing byte.
  auto stake_bytes = encoder.encode(tally::schema::stake_state_t{});
  constexpr auto kStatusOffset = size_t{2 + 3 * 32 + 5 * 8};
  ASSERT_EQ(stake_bytes.size(), kStatusOffset + 2);
  stake_bytes[kStatusOffset] = 2;
  EXPECT_FALSE(encoder
                   .try_decode<tally::schema::stake_state_t>(
                       tally::schema::bytes_view_t{stake_bytes.data(),
                                                   stake_bytes.size()})
                   .has_value());
}

TEST(transaction_types, enum_names_round_trip) {
  EXPECT_EQ(tally::schema::to_string(tally::schema::capability_t::governance),
            "governance");
  EXPECT_EQ(tally::schema::try_from_string<tally::schema::capability_t>(
                "custody_operator"),
            tally::schema::capability_t::custody_operator);
  EXPECT_FALSE(
      tally::schema::try_from_string<tally::schema::capability_t>("root")
          .has_value());
  EXPECT_EQ(tally::schema::to_string(tally::schema::stake_status_t::closed),
            "closed");
  EXPECT_EQ(tally::schema::to_string(
                tally::schema::ledger_event_type_t::stake_settled),
            "stake_settled");
}

TEST(transaction_types, error_codes_have_stable_values_and_names) {
  using tally::schema::transaction_error_code;
  EXPECT_EQ(static_cast<uint32_t>(transaction_error_code::ok), 0u);
  EXPECT_EQ(tally::schema::to_string(transaction_error_code::insufficient_funds),
            "insufficient funds");
  EXPECT_EQ(tally::schema::to_string(transaction_error_code::stake_locked),
            "stake locked");
  EXPECT_EQ(tally::schema::to_string(static_cast<transaction_error_code>(999)),
            "unknown error");
}
