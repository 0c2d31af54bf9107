#pragma once
#include <tally/schema/primitives.hpp>

namespace tally::schema {

template <uint16_t Version>
struct set_rate;

template <>
struct set_rate<1> final {
  uint16_t version{1};
  basis_points_t apy_basis_points{};
};

using set_rate_t = set_rate<1>;

}  // namespace tally::schema
