#pragma once

#include <tally/schema/primitives.hpp>
#include <tally/schema/stake_status.hpp>

// Schema type: stake projection.
// Read-only display view. `pending_points` is exactly what a settlement at
// `as_of_epoch` would add.
namespace tally::schema {

template <uint16_t Version>
struct stake_projection;

template <>
struct stake_projection<1> final {
  uint16_t version{1};
  stake_id_t stake_id;
  stake_status_t status{stake_status_t::active};
  amount_t principal{};
  amount_t settled_points{};
  amount_t pending_points{};
  amount_t projected_points{};
  epoch_t last_settled_epoch{};
  epoch_t as_of_epoch{};
};

using stake_projection_t = stake_projection<1>;

}  // namespace tally::schema
