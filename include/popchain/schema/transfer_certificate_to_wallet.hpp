#pragma once
#include <popchain/schema/primitives.hpp>
#include <cstdint>

// Schema type: transfer certificate to wallet.
// Certificate workflow: Releases a held certificate to the wallet linked to
// the account it was issued to. The sender must be the current custodian.
namespace popchain::schema {

template <uint16_t Version>
struct transfer_certificate_to_wallet;

template <>
struct transfer_certificate_to_wallet<1> final {
  uint16_t version{1};
  account_id_t account_id{};
  object_id_t certificate_id{};
};

using transfer_certificate_to_wallet_t = transfer_certificate_to_wallet<1>;

}  // namespace popchain::schema
