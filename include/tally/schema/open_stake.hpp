#pragma once
#include <tally/schema/primitives.hpp>

// Schema type: open stake.
// Deposits `principal` into the vault and attributes it to a new stake in one
// step. `lock_epochs` delays the earliest close.
namespace tally::schema {

template <uint16_t Version>
struct open_stake;

template <>
struct open_stake<1> final {
  uint16_t version{1};
  vault_id_t vault_id;
  asset_id_t asset_id;
  amount_t principal{};
  uint64_t lock_epochs{};
};

using open_stake_t = open_stake<1>;

}  // namespace tally::schema
