#pragma once
#include <popchain/schema/primitives.hpp>
#include <cstdint>

// Schema type: mint certificate.
// Certificate workflow: Issues one certificate of the carried tier for an
// event to an attendee account. Text fields arrive as raw bytes and are
// decoded on execution. Price is recorded, payment is collected elsewhere.
namespace popchain::schema {

template <uint16_t Version>
struct mint_certificate;

template <>
struct mint_certificate<1> final {
  uint16_t version{1};
  account_id_t account_id{};
  event_id_t event_id{};
  bytes_t url;
  bytes_t tier_name;
  bytes_t tier_description;
  bytes_t tier_url;
  price_t price{};
  address_t service_wallet{};  // escrow custodian for unlinked accounts
};

using mint_certificate_t = mint_certificate<1>;

}  // namespace popchain::schema
