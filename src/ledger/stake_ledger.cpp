#include <spdlog/spdlog.h>
#include <tally/blake3/hash.hpp>
#include <tally/ledger/stake_ledger.hpp>
#include <tally/schema/encoding/scale/encoder.hpp>
#include <iterator>
#include <limits>
#include <tuple>
#include <utility>

using tally::schema::amount_t;
using tally::schema::stake_status_t;
using tally::schema::transaction_error_code;

namespace tally::ledger {

std::optional<tally::accrual::accrual_input> make_accrual_input(
    const tally::schema::stake_state_t& stake,
    const tally::schema::rate_config_t& config,
    tally::schema::epoch_t epoch) {
  if (epoch < stake.last_settled_epoch) {
    return std::nullopt;
  }
  return tally::accrual::accrual_input{
      .principal = stake.principal,
      .apy_basis_points = config.apy_basis_points,
      .epochs_elapsed = epoch - stake.last_settled_epoch,
      .epochs_per_year = config.epochs_per_year};
}

tally::schema::stake_id_t make_stake_id(
    const tally::schema::vault_id_t& vault_id,
    const tally::schema::account_id_t& owner,
    uint64_t nonce) {
  auto encoder = tally::schema::encoding::encoder<
      tally::schema::encoding::scale_encoder_tag>{};
  auto material = encoder.encode(std::tuple{vault_id, owner, nonce});
  return tally::blake3::hash(
      tally::schema::bytes_view_t{material.data(), material.size()});
}

transaction_error_code open_stake(tally::custody::escrow_vault& vault,
                                  const tally::schema::stake_id_t& stake_id,
                                  const tally::schema::account_id_t& owner,
                                  const tally::schema::asset_id_t& asset_id,
                                  amount_t principal,
                                  tally::schema::epoch_t epoch,
                                  uint64_t lock_epochs,
                                  tally::schema::stake_state_t& stake) {
  if (principal == 0) {
    return transaction_error_code::zero_deposit;
  }
  if (lock_epochs > std::numeric_limits<tally::schema::epoch_t>::max() - epoch) {
    return transaction_error_code::overflow;
  }

  auto candidate = vault;
  if (auto code = candidate.deposit(asset_id, principal);
      code != transaction_error_code::ok) {
    return code;
  }
  if (auto code = candidate.attribute(principal);
      code != transaction_error_code::ok) {
    return code;
  }

  vault = std::move(candidate);
  stake = tally::schema::stake_state_t{.stake_id = stake_id,
                                       .vault_id = vault.state().vault_id,
                                       .owner = owner,
                                       .principal = principal,
                                       .opened_epoch = epoch,
                                       .last_settled_epoch = epoch,
                                       .unlock_epoch = epoch + lock_epochs,
                                       .accrued_points = 0,
                                       .status = stake_status_t::active};
  return transaction_error_code::ok;
}

transaction_error_code settle(tally::schema::stake_state_t& stake,
                              const tally::schema::rate_config_t& config,
                              tally::schema::epoch_t epoch,
                              settlement_t& settlement) {
  if (stake.status != stake_status_t::active) {
    return transaction_error_code::not_active;
  }
  auto input = make_accrual_input(stake, config, epoch);
  if (!input) {
    spdlog::warn("Settlement at epoch {} precedes last settlement at {}",
                 epoch, stake.last_settled_epoch);
    return transaction_error_code::epoch_regression;
  }

  settlement = settlement_t{.delta_points = 0,
                            .total_points = stake.accrued_points,
                            .epoch = stake.last_settled_epoch};
  if (input->epochs_elapsed == 0) {
    return transaction_error_code::ok;
  }

  auto delta = tally::accrual::accrue(*input);
  if (!delta) {
    return transaction_error_code::overflow;
  }
  if (*delta > std::numeric_limits<amount_t>::max() - stake.accrued_points) {
    return transaction_error_code::overflow;
  }

  stake.accrued_points += *delta;
  stake.last_settled_epoch = epoch;
  settlement = settlement_t{.delta_points = *delta,
                            .total_points = stake.accrued_points,
                            .epoch = epoch};
  return transaction_error_code::ok;
}

transaction_error_code close(tally::schema::stake_state_t& stake,
                             tally::custody::escrow_vault& vault,
                             const tally::schema::rate_config_t& config,
                             const tally::schema::account_id_t& caller,
                             tally::schema::epoch_t epoch,
                             settlement_t& settlement) {
  if (stake.status != stake_status_t::active) {
    return transaction_error_code::not_active;
  }
  if (caller != stake.owner) {
    return transaction_error_code::unauthorized;
  }
  if (epoch < stake.unlock_epoch) {
    return transaction_error_code::stake_locked;
  }

  auto settled = stake;
  auto final_settlement = settlement_t{};
  if (auto code = settle(settled, config, epoch, final_settlement);
      code != transaction_error_code::ok) {
    return code;
  }

  auto candidate = vault;
  if (auto code = candidate.release(settled.principal);
      code != transaction_error_code::ok) {
    return code;
  }
  if (auto code = candidate.withdraw(settled.principal);
      code != transaction_error_code::ok) {
    return code;
  }

  settled.status = stake_status_t::closed;
  settled.closed_epoch = epoch;
  stake = std::move(settled);
  vault = std::move(candidate);
  settlement = final_settlement;
  return transaction_error_code::ok;
}

}  // namespace tally::ledger
