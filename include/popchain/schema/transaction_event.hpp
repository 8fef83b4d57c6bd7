#pragma once

#include <cstdint>
#include <string>
#include <vector>

// Schema type: transaction event.
// Certificate workflow: Audit log item published by mint and transfer. The
// type names the event kind; attributes carry hex encoded ids and decimal
// numbers. Indexed attributes are the ones event consumers filter on.
namespace popchain::schema {

template <uint16_t Version>
struct transaction_event_attribute;

template <>
struct transaction_event_attribute<1> final {
  uint16_t version{1};
  std::string key;
  std::string value;
  bool index{};
};

using transaction_event_attribute_t = transaction_event_attribute<1>;

template <uint16_t Version>
struct transaction_event;

template <>
struct transaction_event<1> final {
  uint16_t version{1};
  std::string type;
  std::vector<transaction_event_attribute_t> attributes;
};

using transaction_event_t = transaction_event<1>;

}  // namespace popchain::schema
