#pragma once
#include <tally/schema/close_stake.hpp>
#include <tally/schema/create_vault.hpp>
#include <tally/schema/deposit.hpp>
#include <tally/schema/destroy_vault.hpp>
#include <tally/schema/open_stake.hpp>
#include <tally/schema/primitives.hpp>
#include <tally/schema/set_paused.hpp>
#include <tally/schema/set_rate.hpp>
#include <tally/schema/settle_stake.hpp>
#include <tally/schema/upsert_capability.hpp>
#include <tally/schema/withdraw.hpp>
#include <variant>

namespace tally::schema {

using transaction_payload_t = std::variant<create_vault_t,
                                           deposit_t,
                                           withdraw_t,
                                           destroy_vault_t,
                                           open_stake_t,
                                           settle_stake_t,
                                           close_stake_t,
                                           set_rate_t,
                                           set_paused_t,
                                           upsert_capability_t>;

template <uint16_t Version>
struct transaction;

template <>
struct transaction<1> final {
  uint16_t version{1};
  hash32_t chain_id{};
  uint64_t nonce{};
  signer_id_t signer{};
  transaction_payload_t payload{};
  signature_t signature;
};

using transaction_t = transaction<1>;

}  // namespace tally::schema
