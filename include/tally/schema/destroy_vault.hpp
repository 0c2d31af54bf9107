#pragma once
#include <tally/schema/primitives.hpp>

namespace tally::schema {

template <uint16_t Version>
struct destroy_vault;

template <>
struct destroy_vault<1> final {
  uint16_t version{1};
  vault_id_t vault_id;
};

using destroy_vault_t = destroy_vault<1>;

}  // namespace tally::schema
