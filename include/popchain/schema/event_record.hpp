#pragma once

#include <popchain/schema/primitives.hpp>
#include <popchain/schema/transaction_event.hpp>
#include <cstdint>

// Schema type: event record.
// Certificate workflow: Persisted audit log entry, keyed by a monotonically
// increasing event id.
namespace popchain::schema {

template <uint16_t Version>
struct event_record;

template <>
struct event_record<1> final {
  uint16_t version{1};
  uint64_t event_id{};
  uint64_t sequence{};
  timestamp_milliseconds_t recorded_at{};
  transaction_event_t event;
};

using event_record_t = event_record<1>;

}  // namespace popchain::schema
