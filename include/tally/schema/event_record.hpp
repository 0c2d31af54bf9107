#pragma once

#include <tally/schema/transaction_event.hpp>
#include <cstdint>

// Schema type: event record.
// Append-only persisted form of an emitted event, ordered by event_id.
namespace tally::schema {

template <uint16_t Version>
struct event_record;

template <>
struct event_record<1> final {
  uint16_t version{1};
  uint64_t event_id{};
  uint64_t height{};
  uint32_t tx_index{};
  uint64_t epoch{};
  transaction_event_t event;
};

using event_record_t = event_record<1>;

}  // namespace tally::schema
