#include <gtest/gtest.h>
#include <openssl/evp.h>
#include <tally/crypto/verify.hpp>
#include <tally/execution/engine.hpp>
#include <tally/testing/common.hpp>

#include <array>
#include <vector>

TEST(crypto_verify, verifies_ed25519_signatures) {
  if (!tally::crypto::available()) {
    GTEST_SKIP() << "OpenSSL backend does not expose ed25519";
  }
  auto* keygen_ctx = EVP_PKEY_CTX_new_id(EVP_PKEY_ED25519, nullptr);
  ASSERT_NE(keygen_ctx, nullptr);
  ASSERT_EQ(EVP_PKEY_keygen_init(keygen_ctx), 1);
  auto* pkey = static_cast<EVP_PKEY*>(nullptr);
  ASSERT_EQ(EVP_PKEY_keygen(keygen_ctx, &pkey), 1);
  EVP_PKEY_CTX_free(keygen_ctx);

  auto public_key = std::array<uint8_t, 32>{};
  auto public_key_size = public_key.size();
  ASSERT_EQ(
      EVP_PKEY_get_raw_public_key(pkey, public_key.data(), &public_key_size),
      1);
  ASSERT_EQ(public_key_size, public_key.size());

  auto message = std::vector<uint8_t>{'t', 'a', 'l', 'l', 'y'};
  auto signature = std::array<uint8_t, 64>{};
  auto signature_size = signature.size();
  auto* sign_ctx = EVP_MD_CTX_new();
  ASSERT_NE(sign_ctx, nullptr);
  ASSERT_EQ(EVP_DigestSignInit(sign_ctx, nullptr, nullptr, nullptr, pkey), 1);
  ASSERT_EQ(EVP_DigestSign(sign_ctx, signature.data(), &signature_size,
                           message.data(), message.size()),
            1);
  EVP_MD_CTX_free(sign_ctx);
  EVP_PKEY_free(pkey);
  ASSERT_EQ(signature_size, signature.size());

  auto signer = tally::schema::signer_id_t{
      tally::schema::ed25519_signer_id{.public_key = public_key}};
  auto signature_variant = tally::schema::signature_t{signature};
  EXPECT_TRUE(tally::crypto::verify_signature(
      tally::schema::bytes_view_t{message.data(), message.size()}, signer,
      signature_variant));

  message[0] ^= 0x01;
  EXPECT_FALSE(tally::crypto::verify_signature(
      tally::schema::bytes_view_t{message.data(), message.size()}, signer,
      signature_variant));
}

TEST(crypto_verify, rejects_named_signer_signatures) {
  auto named = tally::schema::named_signer_t{};
  named[0] = 0x42;
  auto signature = tally::schema::ed25519_signature_t{};
  auto message = std::array<uint8_t, 3>{'a', 'b', 'c'};
  EXPECT_FALSE(tally::crypto::verify_signature(
      tally::schema::bytes_view_t{message.data(), message.size()},
      tally::schema::signer_id_t{named},
      tally::schema::signature_t{signature}));
}

TEST(crypto_verify, rejects_garbage_public_key) {
  auto signer = tally::testing::make_ed25519_signer(0x10);
  auto signature = tally::schema::ed25519_signature_t{};
  auto message = std::array<uint8_t, 3>{'x', 'y', 'z'};
  EXPECT_FALSE(tally::crypto::verify_signature(
      tally::schema::bytes_view_t{message.data(), message.size()},
      tally::schema::signer_id_t{signer},
      tally::schema::signature_t{signature}));
}

TEST(crypto_verify, signing_payload_excludes_signature) {
  auto tx = tally::schema::transaction_t{
      .chain_id = tally::testing::make_hash(1),
      .nonce = 1,
      .signer = tally::testing::make_named_signer(2),
      .payload = tally::schema::settle_stake_t{
          .stake_id = tally::testing::make_hash(3)}};
  auto unsigned_payload = tally::execution::make_signing_payload(tx);
  auto signed_tx = tx;
  auto signature = tally::schema::ed25519_signature_t{};
  signature.fill(0x5A);
  signed_tx.signature = signature;
  EXPECT_EQ(tally::execution::make_signing_payload(signed_tx), unsigned_payload);

  signed_tx.nonce = 2;
  EXPECT_NE(tally::execution::make_signing_payload(signed_tx), unsigned_payload);
}
