#pragma once
#include <tally/schema/primitives.hpp>
#include <optional>

namespace tally::schema {

template <uint16_t Version>
struct close_stake;

template <>
struct close_stake<1> final {
  uint16_t version{1};
  stake_id_t stake_id;
  // Principal goes back to the owner when no recipient is named.
  std::optional<account_id_t> recipient;
};

using close_stake_t = close_stake<1>;

}  // namespace tally::schema
