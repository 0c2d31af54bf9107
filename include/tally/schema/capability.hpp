#pragma once

#include <tally/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: capability.
// Permission kinds checked before privileged operations run. Issuance and
// delegation live outside this system; the roster only records holders.
namespace tally::schema {

enum class capability_t : uint8_t { governance = 0, custody_operator = 1 };

inline constexpr auto kCapabilityMappings = std::array{
    std::pair<std::string_view, capability_t>{"governance",
                                              capability_t::governance},
    std::pair<std::string_view, capability_t>{"custody_operator",
                                              capability_t::custody_operator},
};

template <>
inline std::optional<capability_t> try_from_string<capability_t>(
    const std::string_view value) {
  return from_string(value, kCapabilityMappings);
}

inline constexpr std::string_view to_string(const capability_t value) {
  return to_string(value, kCapabilityMappings).value_or("unknown");
}

}  // namespace tally::schema
