#pragma once
#include <popchain/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <vector>

// Schema type: account state.
// Certificate workflow: Attendee account owned by the account service. The
// owner is empty until a wallet is linked; certificate ids are kept in mint
// order and only ever appended.
namespace popchain::schema {

template <uint16_t Version>
struct account_state;

template <>
struct account_state<1> final {
  uint16_t version{1};
  account_id_t account_id{};
  std::optional<address_t> owner;
  std::vector<object_id_t> certificate_ids;
};

using account_state_t = account_state<1>;

}  // namespace popchain::schema
