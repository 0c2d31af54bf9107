#pragma once

#include <tally/accrual/accrual.hpp>
#include <tally/custody/escrow_vault.hpp>
#include <tally/schema/primitives.hpp>
#include <tally/schema/rate_config.hpp>
#include <tally/schema/stake_state.hpp>
#include <tally/schema/transaction_error_code.hpp>
#include <cstdint>
#include <optional>

namespace tally::ledger {

/// Outcome of one settlement. `delta_points == 0` with `epoch` equal to the
/// previous `last_settled_epoch` means the call collapsed into a no-op.
struct settlement_t final {
  tally::schema::amount_t delta_points{};
  tally::schema::amount_t total_points{};
  tally::schema::epoch_t epoch{};
};

/// The arguments a settlement at `epoch` passes to `accrual::accrue`.
///
/// Settlement and projection both go through here. Returns std::nullopt when
/// `epoch` precedes the stake's last settlement.
std::optional<tally::accrual::accrual_input> make_accrual_input(
    const tally::schema::stake_state_t& stake,
    const tally::schema::rate_config_t& config,
    tally::schema::epoch_t epoch);

/// Deterministic stake identifier: BLAKE3(vault_id || owner || nonce).
tally::schema::stake_id_t make_stake_id(
    const tally::schema::vault_id_t& vault_id,
    const tally::schema::account_id_t& owner,
    uint64_t nonce);

/// Deposit `principal` into `vault`, attribute it, and create an active stake.
///
/// `vault` and `stake` are only written when the call returns `ok`.
tally::schema::transaction_error_code open_stake(
    tally::custody::escrow_vault& vault,
    const tally::schema::stake_id_t& stake_id,
    const tally::schema::account_id_t& owner,
    const tally::schema::asset_id_t& asset_id,
    tally::schema::amount_t principal,
    tally::schema::epoch_t epoch,
    uint64_t lock_epochs,
    tally::schema::stake_state_t& stake);

/// Bring `stake` up to `epoch`. Idempotent within an epoch.
tally::schema::transaction_error_code settle(
    tally::schema::stake_state_t& stake,
    const tally::schema::rate_config_t& config,
    tally::schema::epoch_t epoch,
    settlement_t& settlement);

/// Final settlement, transition to closed, release attribution and withdraw
/// the principal out of `vault`. Nothing changes unless the call returns `ok`.
tally::schema::transaction_error_code close(
    tally::schema::stake_state_t& stake,
    tally::custody::escrow_vault& vault,
    const tally::schema::rate_config_t& config,
    const tally::schema::account_id_t& caller,
    tally::schema::epoch_t epoch,
    settlement_t& settlement);

}  // namespace tally::ledger
