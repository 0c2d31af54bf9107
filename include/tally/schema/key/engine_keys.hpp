#pragma once

#include <tally/schema/capability.hpp>
#include <tally/schema/primitives.hpp>
#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <utility>

// Schema key type: engine keys.
// Canonical key prefixes and key codecs for ledger state, history and events.
namespace tally::schema::key {

inline constexpr std::string_view kStatePrefix{"SYS|STATE|"};
inline constexpr std::string_view kNonceKeyPrefix{"SYS|STATE|NONCE|"};
inline constexpr std::string_view kGenesisKeyPrefix{"SYS|STATE|GENESIS|"};
inline constexpr std::string_view kRateConfigKeyPrefix{
    "SYS|STATE|RATE_CONFIG|"};
inline constexpr std::string_view kVaultKeyPrefix{"SYS|STATE|VAULT|"};
inline constexpr std::string_view kStakeKeyPrefix{"SYS|STATE|STAKE|"};
inline constexpr std::string_view kCapabilityKeyPrefix{
    "SYS|STATE|CAPABILITY|"};
inline constexpr std::string_view kProtocolModeKeyPrefix{
    "SYS|STATE|PROTOCOL_MODE|"};
inline constexpr std::string_view kEventSeqKeyPrefix{"SYS|STATE|EVENT_SEQ|"};
inline constexpr std::string_view kHistoryPrefix{"SYS|HISTORY|TX|"};
inline constexpr std::string_view kEventPrefix{"SYS|EVENT|"};

inline const std::array<std::string_view, 11> kEngineKeyspaces{
    kStatePrefix,         kNonceKeyPrefix,        kGenesisKeyPrefix,
    kRateConfigKeyPrefix, kVaultKeyPrefix,        kStakeKeyPrefix,
    kCapabilityKeyPrefix, kProtocolModeKeyPrefix, kEventSeqKeyPrefix,
    kHistoryPrefix,       kEventPrefix};

template <typename Encoder, typename T>
tally::schema::bytes_t make_prefixed_key(Encoder& encoder,
                                         std::string_view prefix,
                                         const T& id) {
  // SCALE product types are encoded as concatenated field bytes.
  // This is equivalent to encoding tuple{prefix, id}.
  auto key = encoder.encode(prefix);
  encoder.encode(id, key);
  return key;
}

template <typename Encoder>
tally::schema::bytes_t make_prefix_key(Encoder& encoder,
                                       std::string_view prefix) {
  return encoder.encode(prefix);
}

template <typename Encoder>
tally::schema::bytes_t make_nonce_key(Encoder& encoder,
                                      const tally::schema::signer_id_t& signer) {
  return make_prefixed_key(encoder, kNonceKeyPrefix, signer);
}

template <typename Encoder>
tally::schema::bytes_t make_genesis_key(Encoder& encoder) {
  return make_prefixed_key(encoder, kGenesisKeyPrefix,
                           std::string_view{"CURRENT"});
}

template <typename Encoder>
tally::schema::bytes_t make_rate_config_key(Encoder& encoder) {
  return make_prefixed_key(encoder, kRateConfigKeyPrefix,
                           std::string_view{"CURRENT"});
}

template <typename Encoder>
tally::schema::bytes_t make_vault_key(
    Encoder& encoder,
    const tally::schema::vault_id_t& vault_id) {
  return make_prefixed_key(encoder, kVaultKeyPrefix, vault_id);
}

template <typename Encoder>
tally::schema::bytes_t make_stake_key(
    Encoder& encoder,
    const tally::schema::stake_id_t& stake_id) {
  return make_prefixed_key(encoder, kStakeKeyPrefix, stake_id);
}

template <typename Encoder>
tally::schema::bytes_t make_capability_key(
    Encoder& encoder,
    const tally::schema::account_id_t& subject,
    const tally::schema::capability_t capability) {
  return make_prefixed_key(encoder, kCapabilityKeyPrefix,
                           std::tuple{subject, capability});
}

template <typename Encoder>
tally::schema::bytes_t make_protocol_mode_key(Encoder& encoder) {
  return make_prefixed_key(encoder, kProtocolModeKeyPrefix,
                           std::string_view{"CURRENT"});
}

template <typename Encoder>
tally::schema::bytes_t make_event_sequence_key(Encoder& encoder) {
  return make_prefixed_key(encoder, kEventSeqKeyPrefix,
                           std::string_view{"NEXT"});
}

template <typename Encoder>
tally::schema::bytes_t make_history_key(Encoder& encoder,
                                        uint64_t height,
                                        uint32_t index) {
  return make_prefixed_key(encoder, kHistoryPrefix, std::tuple{height, index});
}

template <typename Encoder>
tally::schema::bytes_t make_event_key(Encoder& encoder, uint64_t event_id) {
  return make_prefixed_key(encoder, kEventPrefix, event_id);
}

template <typename Encoder>
std::optional<std::pair<uint64_t, uint32_t>> parse_history_key(
    Encoder& encoder,
    const tally::schema::bytes_view_t& key) {
  auto decoded = encoder.template try_decode<
      std::tuple<std::string, std::tuple<uint64_t, uint32_t>>>(key);
  if (!decoded.has_value()) {
    return std::nullopt;
  }
  if (std::get<0>(decoded.value()) != kHistoryPrefix) {
    return std::nullopt;
  }
  return std::pair<uint64_t, uint32_t>{
      std::get<0>(std::get<1>(decoded.value())),
      std::get<1>(std::get<1>(decoded.value()))};
}

template <typename Encoder>
std::optional<uint64_t> parse_event_key(Encoder& encoder,
                                        const tally::schema::bytes_view_t& key) {
  auto decoded =
      encoder.template try_decode<std::tuple<std::string, uint64_t>>(key);
  if (!decoded.has_value()) {
    return std::nullopt;
  }
  if (std::get<0>(decoded.value()) != kEventPrefix) {
    return std::nullopt;
  }
  return std::get<1>(decoded.value());
}

}  // namespace tally::schema::key
