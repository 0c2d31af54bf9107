#pragma once

#include <tally/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: stake status.
// Stake lifecycle enum. `closed` is terminal; only `active` stakes mutate.
namespace tally::schema {

enum class stake_status_t : uint8_t { active = 0, closed = 1 };

inline constexpr auto kStakeStatusMappings = std::array{
    std::pair<std::string_view, stake_status_t>{"active",
                                                stake_status_t::active},
    std::pair<std::string_view, stake_status_t>{"closed",
                                                stake_status_t::closed},
};

template <>
inline std::optional<stake_status_t> try_from_string<stake_status_t>(
    const std::string_view value) {
  return from_string(value, kStakeStatusMappings);
}

inline constexpr std::string_view to_string(const stake_status_t value) {
  return to_string(value, kStakeStatusMappings).value_or("unknown");
}

}  // namespace tally::schema
