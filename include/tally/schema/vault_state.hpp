#pragma once
#include <tally/schema/primitives.hpp>
#include <optional>

// Schema type: vault state.
// Custody record for one asset type. `balance` only moves through checked
// deposit/withdraw; `attributed_principal` is the share of `balance` backing
// active stakes.
namespace tally::schema {

template <uint16_t Version>
struct vault_state;

template <>
struct vault_state<1> final {
  uint16_t version{1};
  vault_id_t vault_id;
  asset_id_t asset_id;
  account_id_t creator;
  amount_t balance{};
  amount_t attributed_principal{};
  amount_t total_deposited{};
  amount_t total_withdrawn{};
  uint64_t active_stakes{};
  epoch_t created_epoch{};
  std::optional<bytes_t> label;
};

using vault_state_t = vault_state<1>;

}  // namespace tally::schema
