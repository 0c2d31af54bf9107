#include <spdlog/spdlog.h>
#include <tally/accrual/accrual.hpp>
#include <tally/config/rate_config.hpp>

using tally::schema::transaction_error_code;

namespace tally::config {

transaction_error_code validate(const tally::schema::rate_config_t& config) {
  if (config.version != 1) {
    return transaction_error_code::invalid_rate;
  }
  if (config.epochs_per_year == 0) {
    return transaction_error_code::invalid_rate;
  }
  if (config.apy_basis_points > config.max_apy_basis_points) {
    return transaction_error_code::invalid_rate;
  }
  return transaction_error_code::ok;
}

transaction_error_code validate_genesis(
    const tally::schema::rate_config_t& config) {
  if (config.max_apy_basis_points > tally::accrual::kBasisPointDenominator) {
    return transaction_error_code::invalid_rate;
  }
  return validate(config);
}

transaction_error_code set_rate(tally::schema::rate_config_t& config,
                                tally::schema::basis_points_t apy_basis_points) {
  auto candidate = config;
  candidate.apy_basis_points = apy_basis_points;
  auto code = validate(candidate);
  if (code != transaction_error_code::ok) {
    spdlog::debug("Rejected rate {} bps (max {} bps)", apy_basis_points,
                  config.max_apy_basis_points);
    return code;
  }
  config = candidate;
  return transaction_error_code::ok;
}

}  // namespace tally::config
