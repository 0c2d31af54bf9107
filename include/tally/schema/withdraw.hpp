#pragma once
#include <tally/schema/primitives.hpp>

namespace tally::schema {

template <uint16_t Version>
struct withdraw;

template <>
struct withdraw<1> final {
  uint16_t version{1};
  vault_id_t vault_id;
  amount_t amount{};
  account_id_t recipient;
};

using withdraw_t = withdraw<1>;

}  // namespace tally::schema
