#pragma once

#include <gtest/gtest.h>

#include <tally/execution/engine.hpp>
#include <tally/schema/encoding/scale/encoder.hpp>
#include <tally/testing/common.hpp>

#include <cstdint>
#include <optional>
#include <string_view>
#include <tuple>
#include <vector>

namespace tally::testing {

using scale_encoder_t = tally::schema::encoding::encoder<
    tally::schema::encoding::scale_encoder_tag>;

inline tally::schema::transaction_t make_transaction(
    const tally::schema::hash32_t& chain_id,
    const uint64_t nonce,
    const tally::schema::signer_id_t& signer,
    const tally::schema::transaction_payload_t& payload) {
  return tally::schema::transaction_t{
      .version = 1,
      .chain_id = chain_id,
      .nonce = nonce,
      .signer = signer,
      .payload = payload,
      .signature = tally::schema::ed25519_signature_t{}};
}

inline tally::schema::bytes_t encode_transaction(
    const tally::schema::transaction_t& tx) {
  auto encoder = scale_encoder_t{};
  return encoder.encode(tx);
}

/// Finalize and commit one block, returning the per-tx results.
inline std::vector<tally::schema::transaction_result_t> apply_block(
    tally::execution::engine& engine,
    const uint64_t height,
    const tally::schema::epoch_t epoch,
    const std::vector<tally::schema::transaction_t>& txs) {
  auto raw = std::vector<tally::schema::bytes_t>{};
  raw.reserve(txs.size());
  for (const auto& tx : txs) {
    raw.push_back(encode_transaction(tx));
  }
  auto block = engine.finalize_block(height, epoch, raw);
  EXPECT_EQ(block.tx_results.size(), txs.size());
  (void)engine.commit();
  return block.tx_results;
}

inline tally::schema::transaction_result_t apply_single(
    tally::execution::engine& engine,
    const uint64_t height,
    const tally::schema::epoch_t epoch,
    const tally::schema::transaction_t& tx) {
  auto results = apply_block(engine, height, epoch, {tx});
  return results.front();
}

/// Run `path` with a SCALE-encoded key and decode the value as `T`.
template <typename T, typename Key>
std::optional<T> query_value(tally::execution::engine& engine,
                             const std::string_view path,
                             const Key& key) {
  auto encoder = scale_encoder_t{};
  const auto raw_key = encoder.encode(key);
  const auto result = engine.query(
      path, tally::schema::bytes_view_t{raw_key.data(), raw_key.size()});
  if (result.code != 0) {
    return std::nullopt;
  }
  return encoder.decode<T>(
      tally::schema::bytes_view_t{result.value.data(), result.value.size()});
}

/// Run a keyless route such as /state/config.
template <typename T>
std::optional<T> query_state(tally::execution::engine& engine,
                             const std::string_view path) {
  const auto result = engine.query(path, {});
  if (result.code != 0) {
    return std::nullopt;
  }
  auto encoder = scale_encoder_t{};
  return encoder.decode<T>(
      tally::schema::bytes_view_t{result.value.data(), result.value.size()});
}

inline std::vector<tally::schema::event_record_t> query_events(
    tally::execution::engine& engine,
    const uint64_t from_id,
    const uint64_t to_id) {
  auto events = query_value<std::vector<tally::schema::event_record_t>>(
      engine, "/events/range", std::tuple{from_id, to_id});
  EXPECT_TRUE(events.has_value());
  return events.value_or(std::vector<tally::schema::event_record_t>{});
}

inline std::optional<std::string> event_attribute(
    const tally::schema::transaction_event_t& event,
    const std::string_view key) {
  for (const auto& attribute : event.attributes) {
    if (attribute.key == key) {
      return attribute.value;
    }
  }
  return std::nullopt;
}

}  // namespace tally::testing
