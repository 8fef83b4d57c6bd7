#pragma once
#include <popchain/schema/primitives.hpp>
#include <popchain/schema/url.hpp>
#include <cstdint>
#include <optional>
#include <string>

// Schema type: certificate.
// Certificate workflow: Issued proof-of-participation bound to one event and
// one tier snapshot. Every field is fixed at mint time; current custody lives
// in the ledger custody table, not in `issued_to`.
namespace popchain::schema {

template <uint16_t Version>
struct certificate;

template <>
struct certificate<1> final {
  uint16_t version{1};
  object_id_t id{};
  event_id_t event_id{};
  std::string tier_name;
  url_t url;
  url_t tier_url;
  std::optional<address_t> issued_to;  // empty when minted to an unlinked account
  timestamp_milliseconds_t issued_at{};
  price_t mint_price{};
};

using certificate_t = certificate<1>;

}  // namespace popchain::schema
