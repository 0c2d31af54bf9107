#pragma once

#include <tally/schema/rate_config.hpp>
#include <tally/schema/stake_projection.hpp>
#include <tally/schema/stake_state.hpp>
#include <tally/schema/vault_projection.hpp>
#include <tally/schema/vault_state.hpp>
#include <optional>

namespace tally::ledger {

/// Read-only projection of `stake` at `epoch`.
///
/// `pending_points` is computed from the same accrual input a settlement at
/// `epoch` would use. Closed stakes and epochs at or before the last
/// settlement report no pending points. Returns std::nullopt when the
/// projected total does not fit `amount_t`.
std::optional<tally::schema::stake_projection_t> project(
    const tally::schema::stake_state_t& stake,
    const tally::schema::rate_config_t& config,
    tally::schema::epoch_t epoch);

tally::schema::vault_projection_t project(
    const tally::schema::vault_state_t& vault,
    tally::schema::epoch_t epoch);

}  // namespace tally::ledger
