#pragma once

#include <tally/schema/primitives.hpp>
#include <optional>

namespace tally::schema {

template <uint16_t Version>
struct set_paused;

template <>
struct set_paused<1> final {
  uint16_t version{1};
  bool paused{};
  std::optional<bytes_t> reason;
};

using set_paused_t = set_paused<1>;
using protocol_mode_state_t = set_paused<1>;

}  // namespace tally::schema
