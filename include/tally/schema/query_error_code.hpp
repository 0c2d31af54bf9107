#pragma once

#include <cstdint>

namespace tally::schema {

enum class query_error_code : uint32_t {
  invalid_key = 1,
  unsupported_path = 2,
  not_found = 3,
  projection_overflow = 4,
};

}  // namespace tally::schema
