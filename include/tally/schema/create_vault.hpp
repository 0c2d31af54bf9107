#pragma once
#include <tally/schema/primitives.hpp>
#include <optional>

namespace tally::schema {

template <uint16_t Version>
struct create_vault;

template <>
struct create_vault<1> final {
  uint16_t version{1};
  vault_id_t vault_id;
  asset_id_t asset_id;
  std::optional<bytes_t> label;
};

using create_vault_t = create_vault<1>;

}  // namespace tally::schema
