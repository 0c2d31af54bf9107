#include <spdlog/spdlog.h>
#include <tally/accrual/accrual.hpp>
#include <tally/common/critical.hpp>
#include <limits>

namespace tally::accrual {

std::optional<tally::schema::amount_t> accrue(
    tally::schema::amount_t principal,
    tally::schema::basis_points_t apy_basis_points,
    uint64_t epochs_elapsed,
    uint64_t epochs_per_year) {
  if (epochs_per_year == 0) {
    tally::common::critical("accrual requested with zero epochs_per_year");
  }
  if (principal == 0 || apy_basis_points == 0 || epochs_elapsed == 0) {
    return tally::schema::amount_t{0};
  }

  auto numerator = tally::schema::wide_amount_t{principal};
  numerator *= apy_basis_points;
  numerator *= epochs_elapsed;
  auto denominator = tally::schema::wide_amount_t{kBasisPointDenominator};
  denominator *= epochs_per_year;

  auto points = tally::schema::wide_amount_t{numerator / denominator};
  if (points > std::numeric_limits<tally::schema::amount_t>::max()) {
    spdlog::warn(
        "Accrual overflow: principal={} apy_bps={} epochs={} epochs_per_year={}",
        principal, apy_basis_points, epochs_elapsed, epochs_per_year);
    return std::nullopt;
  }
  return points.convert_to<tally::schema::amount_t>();
}

std::optional<tally::schema::amount_t> accrue(const accrual_input& input) {
  return accrue(input.principal, input.apy_basis_points, input.epochs_elapsed,
                input.epochs_per_year);
}

}  // namespace tally::accrual
