#pragma once

#include <tally/schema/rate_config.hpp>
#include <tally/schema/transaction_error_code.hpp>

namespace tally::config {

/// Check `0 <= apy <= max_apy` and `epochs_per_year > 0`.
tally::schema::transaction_error_code validate(
    const tally::schema::rate_config_t& config);

/// Stricter check applied once at genesis: additionally `max_apy <= 10000`.
tally::schema::transaction_error_code validate_genesis(
    const tally::schema::rate_config_t& config);

/// Replace the current rate. No effect on `config` when rejected.
///
/// Rates above `max_apy_basis_points` fail with `invalid_rate`. Already
/// settled points are never recomputed; the new rate applies from the next
/// settlement onward.
tally::schema::transaction_error_code set_rate(
    tally::schema::rate_config_t& config,
    tally::schema::basis_points_t apy_basis_points);

}  // namespace tally::config
