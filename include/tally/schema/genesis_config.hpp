#pragma once

#include <tally/schema/primitives.hpp>
#include <tally/schema/rate_config.hpp>
#include <vector>

// Schema type: genesis config.
// Written to state once, on the first start against an empty database.
namespace tally::schema {

template <uint16_t Version>
struct genesis_config;

template <>
struct genesis_config<1> final {
  uint16_t version{1};
  hash32_t chain_id;
  rate_config_t rate;
  std::vector<account_id_t> governance;
  std::vector<account_id_t> custody_operators;
};

using genesis_config_t = genesis_config<1>;

}  // namespace tally::schema
