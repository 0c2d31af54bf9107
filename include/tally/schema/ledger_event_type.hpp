#pragma once

#include <tally/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace tally::schema {

enum class ledger_event_type_t : uint8_t {
  vault_created = 0,
  deposited = 1,
  withdrawn = 2,
  vault_destroyed = 3,
  stake_opened = 4,
  stake_settled = 5,
  stake_closed = 6,
  rate_updated = 7,
  mode_changed = 8,
  capability_updated = 9,
};

inline constexpr auto kLedgerEventTypeMappings = std::array{
    std::pair<std::string_view, ledger_event_type_t>{
        "vault_created", ledger_event_type_t::vault_created},
    std::pair<std::string_view, ledger_event_type_t>{
        "deposited", ledger_event_type_t::deposited},
    std::pair<std::string_view, ledger_event_type_t>{
        "withdrawn", ledger_event_type_t::withdrawn},
    std::pair<std::string_view, ledger_event_type_t>{
        "vault_destroyed", ledger_event_type_t::vault_destroyed},
    std::pair<std::string_view, ledger_event_type_t>{
        "stake_opened", ledger_event_type_t::stake_opened},
    std::pair<std::string_view, ledger_event_type_t>{
        "stake_settled", ledger_event_type_t::stake_settled},
    std::pair<std::string_view, ledger_event_type_t>{
        "stake_closed", ledger_event_type_t::stake_closed},
    std::pair<std::string_view, ledger_event_type_t>{
        "rate_updated", ledger_event_type_t::rate_updated},
    std::pair<std::string_view, ledger_event_type_t>{
        "mode_changed", ledger_event_type_t::mode_changed},
    std::pair<std::string_view, ledger_event_type_t>{
        "capability_updated", ledger_event_type_t::capability_updated},
};

template <>
inline std::optional<ledger_event_type_t> try_from_string<ledger_event_type_t>(
    const std::string_view value) {
  return from_string(value, kLedgerEventTypeMappings);
}

inline constexpr std::string_view to_string(const ledger_event_type_t value) {
  return to_string(value, kLedgerEventTypeMappings).value_or("unknown");
}

}  // namespace tally::schema
