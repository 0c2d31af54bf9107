#pragma once

#include <tally/schema/enum_string.hpp>
#include <array>
#include <cstdint>
#include <string_view>
#include <utility>

namespace tally::schema {

enum class transaction_error_code : uint32_t {
  ok = 0,
  invalid_transaction = 1,
  unsupported_transaction_version = 2,
  invalid_chain_id = 3,
  invalid_nonce = 4,
  signature_verification_failed = 5,
  unauthorized = 6,
  zero_deposit = 10,
  insufficient_funds = 11,
  vault_not_empty = 12,
  not_active = 13,
  invalid_rate = 14,
  overflow = 15,
  vault_exists = 20,
  vault_missing = 21,
  stake_exists = 22,
  stake_missing = 23,
  asset_mismatch = 24,
  protocol_paused = 25,
  stake_locked = 26,
  epoch_regression = 27,
};

inline constexpr auto kTransactionErrorCodeMappings = std::array{
    std::pair<std::string_view, transaction_error_code>{
        "ok", transaction_error_code::ok},
    std::pair<std::string_view, transaction_error_code>{
        "invalid transaction", transaction_error_code::invalid_transaction},
    std::pair<std::string_view, transaction_error_code>{
        "unsupported transaction version", transaction_error_code::unsupported_transaction_version},
    std::pair<std::string_view, transaction_error_code>{
        "invalid chain id", transaction_error_code::invalid_chain_id},
    std::pair<std::string_view, transaction_error_code>{
        "invalid nonce", transaction_error_code::invalid_nonce},
    std::pair<std::string_view, transaction_error_code>{
        "signature verification failed", transaction_error_code::signature_verification_failed},
    std::pair<std::string_view, transaction_error_code>{
        "unauthorized", transaction_error_code::unauthorized},
    std::pair<std::string_view, transaction_error_code>{
        "zero deposit", transaction_error_code::zero_deposit},
    std::pair<std::string_view, transaction_error_code>{
        "insufficient funds", transaction_error_code::insufficient_funds},
    std::pair<std::string_view, transaction_error_code>{
        "vault not empty", transaction_error_code::vault_not_empty},
    std::pair<std::string_view, transaction_error_code>{
        "stake not active", transaction_error_code::not_active},
    std::pair<std::string_view, transaction_error_code>{
        "invalid rate", transaction_error_code::invalid_rate},
    std::pair<std::string_view, transaction_error_code>{
        "arithmetic overflow", transaction_error_code::overflow},
    std::pair<std::string_view, transaction_error_code>{
        "vault already exists", transaction_error_code::vault_exists},
    std::pair<std::string_view, transaction_error_code>{
        "vault not found", transaction_error_code::vault_missing},
    std::pair<std::string_view, transaction_error_code>{
        "stake already exists", transaction_error_code::stake_exists},
    std::pair<std::string_view, transaction_error_code>{
        "stake not found", transaction_error_code::stake_missing},
    std::pair<std::string_view, transaction_error_code>{
        "asset mismatch", transaction_error_code::asset_mismatch},
    std::pair<std::string_view, transaction_error_code>{
        "protocol paused", transaction_error_code::protocol_paused},
    std::pair<std::string_view, transaction_error_code>{
        "stake locked", transaction_error_code::stake_locked},
    std::pair<std::string_view, transaction_error_code>{
        "epoch regression", transaction_error_code::epoch_regression},
};

inline constexpr std::string_view to_string(const transaction_error_code value) {
  return to_string(value, kTransactionErrorCodeMappings).value_or("unknown error");
}

}  // namespace tally::schema
