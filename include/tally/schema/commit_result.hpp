#pragma once

#include <tally/schema/primitives.hpp>
#include <cstdint>

namespace tally::schema {

template <uint16_t Version>
struct commit_result;

template <>
struct commit_result<1> final {
  uint16_t version{1};
  int64_t committed_height{};
  epoch_t committed_epoch{};
  hash32_t state_root;
};

using commit_result_t = commit_result<1>;

}  // namespace tally::schema
