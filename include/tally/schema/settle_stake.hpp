#pragma once
#include <tally/schema/primitives.hpp>

namespace tally::schema {

template <uint16_t Version>
struct settle_stake;

template <>
struct settle_stake<1> final {
  uint16_t version{1};
  stake_id_t stake_id;
};

using settle_stake_t = settle_stake<1>;

}  // namespace tally::schema
