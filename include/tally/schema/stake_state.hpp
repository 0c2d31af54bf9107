#pragma once
#include <tally/schema/primitives.hpp>
#include <tally/schema/stake_status.hpp>
#include <optional>

namespace tally::schema {

template <uint16_t Version>
struct stake_state;

template <>
struct stake_state<1> final {
  uint16_t version{1};
  stake_id_t stake_id;
  vault_id_t vault_id;
  account_id_t owner;
  amount_t principal{};
  epoch_t opened_epoch{};
  epoch_t last_settled_epoch{};
  epoch_t unlock_epoch{};
  amount_t accrued_points{};
  stake_status_t status{stake_status_t::active};
  std::optional<epoch_t> closed_epoch;
};

using stake_state_t = stake_state<1>;

}  // namespace tally::schema
