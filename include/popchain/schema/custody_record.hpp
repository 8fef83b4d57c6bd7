#pragma once
#include <popchain/schema/primitives.hpp>
#include <cstdint>

// Schema type: custody record.
// Certificate workflow: Current exclusive holder of a certificate object.
namespace popchain::schema {

template <uint16_t Version>
struct custody_record;

template <>
struct custody_record<1> final {
  uint16_t version{1};
  object_id_t object_id{};
  address_t holder{};
  timestamp_milliseconds_t since{};
};

using custody_record_t = custody_record<1>;

}  // namespace popchain::schema
