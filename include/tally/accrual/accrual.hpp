#pragma once

#include <tally/schema/primitives.hpp>
#include <cstdint>
#include <optional>

namespace tally::accrual {

/// 10000 basis points == 100% annual yield.
inline constexpr uint64_t kBasisPointDenominator = 10000;

/// Complete argument set for one accrual evaluation.
struct accrual_input final {
  tally::schema::amount_t principal{};
  tally::schema::basis_points_t apy_basis_points{};
  uint64_t epochs_elapsed{};
  uint64_t epochs_per_year{};
};

/// Points owed for holding `principal` at `apy_basis_points` for
/// `epochs_elapsed` epochs:
///
///   principal * apy_basis_points * epochs_elapsed
///   ---------------------------------------------
///       kBasisPointDenominator * epochs_per_year
///
/// Evaluated on a 256-bit intermediate, multiplying before dividing and
/// truncating toward zero. Returns std::nullopt when the result does not fit
/// `amount_t`. `epochs_per_year` must be non-zero; rate configuration
/// validation guarantees it for every stored config.
std::optional<tally::schema::amount_t> accrue(
    tally::schema::amount_t principal,
    tally::schema::basis_points_t apy_basis_points,
    uint64_t epochs_elapsed,
    uint64_t epochs_per_year);

std::optional<tally::schema::amount_t> accrue(const accrual_input& input);

}  // namespace tally::accrual
