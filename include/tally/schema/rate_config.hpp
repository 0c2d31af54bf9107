#pragma once
#include <tally/schema/primitives.hpp>

// Schema type: rate config.
// Governance-set accrual parameters. The rate is always an annual yield in
// basis points; it is never a per-epoch point multiplier.
namespace tally::schema {

template <uint16_t Version>
struct rate_config;

template <>
struct rate_config<1> final {
  uint16_t version{1};
  basis_points_t apy_basis_points{};
  basis_points_t max_apy_basis_points{};
  uint64_t epochs_per_year{};
};

using rate_config_t = rate_config<1>;

}  // namespace tally::schema
