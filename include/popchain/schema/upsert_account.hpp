#pragma once
#include <popchain/schema/primitives.hpp>
#include <cstdint>
#include <optional>

// Schema type: upsert account.
// Certificate workflow: Account service hook. Creates an attendee account or
// links a wallet to an unlinked one. A linked owner is never replaced.
namespace popchain::schema {

template <uint16_t Version>
struct upsert_account;

template <>
struct upsert_account<1> final {
  uint16_t version{1};
  account_id_t account_id{};
  std::optional<address_t> owner;
};

using upsert_account_t = upsert_account<1>;

}  // namespace popchain::schema
