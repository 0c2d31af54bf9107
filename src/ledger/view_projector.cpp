#include <tally/accrual/accrual.hpp>
#include <tally/ledger/stake_ledger.hpp>
#include <tally/ledger/view_projector.hpp>
#include <limits>

using tally::schema::amount_t;

namespace tally::ledger {

std::optional<tally::schema::stake_projection_t> project(
    const tally::schema::stake_state_t& stake,
    const tally::schema::rate_config_t& config,
    tally::schema::epoch_t epoch) {
  auto projection = tally::schema::stake_projection_t{
      .stake_id = stake.stake_id,
      .status = stake.status,
      .principal = stake.principal,
      .settled_points = stake.accrued_points,
      .pending_points = 0,
      .projected_points = stake.accrued_points,
      .last_settled_epoch = stake.last_settled_epoch,
      .as_of_epoch = epoch};

  if (stake.status != tally::schema::stake_status_t::active) {
    projection.as_of_epoch = stake.closed_epoch.value_or(stake.last_settled_epoch);
    return projection;
  }

  auto input = make_accrual_input(stake, config, epoch);
  if (!input) {
    projection.as_of_epoch = stake.last_settled_epoch;
    return projection;
  }

  auto pending = tally::accrual::accrue(*input);
  if (!pending ||
      *pending > std::numeric_limits<amount_t>::max() - stake.accrued_points) {
    return std::nullopt;
  }
  projection.pending_points = *pending;
  projection.projected_points = stake.accrued_points + *pending;
  return projection;
}

tally::schema::vault_projection_t project(
    const tally::schema::vault_state_t& vault,
    tally::schema::epoch_t epoch) {
  return tally::schema::vault_projection_t{
      .vault_id = vault.vault_id,
      .asset_id = vault.asset_id,
      .balance = vault.balance,
      .attributed_principal = vault.attributed_principal,
      .free_balance = vault.balance - vault.attributed_principal,
      .active_stakes = vault.active_stakes,
      .as_of_epoch = epoch};
}

}  // namespace tally::ledger
