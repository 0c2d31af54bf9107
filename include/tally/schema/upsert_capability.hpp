#pragma once

#include <tally/schema/capability.hpp>
#include <tally/schema/primitives.hpp>

namespace tally::schema {

template <uint16_t Version>
struct upsert_capability;

template <>
struct upsert_capability<1> final {
  uint16_t version{1};
  account_id_t subject;
  capability_t capability{capability_t::custody_operator};
  bool enabled{true};
};

using upsert_capability_t = upsert_capability<1>;
using capability_assignment_state_t = upsert_capability<1>;

}  // namespace tally::schema
