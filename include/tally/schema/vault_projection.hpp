#pragma once

#include <tally/schema/primitives.hpp>

namespace tally::schema {

template <uint16_t Version>
struct vault_projection;

template <>
struct vault_projection<1> final {
  uint16_t version{1};
  vault_id_t vault_id;
  asset_id_t asset_id;
  amount_t balance{};
  amount_t attributed_principal{};
  amount_t free_balance{};
  uint64_t active_stakes{};
  epoch_t as_of_epoch{};
};

using vault_projection_t = vault_projection<1>;

}  // namespace tally::schema
