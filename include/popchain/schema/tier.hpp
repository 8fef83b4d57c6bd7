#pragma once
#include <popchain/schema/primitives.hpp>
#include <popchain/schema/url.hpp>
#include <cstdint>
#include <string>

// Schema type: tier.
// Certificate workflow: Priced template describing a class of certificate.
// A tier is consumed by minting and has no further lifecycle.
namespace popchain::schema {

template <uint16_t Version>
struct tier;

template <>
struct tier<1> final {
  uint16_t version{1};
  std::string name;
  std::string description;
  url_t url;
  price_t price{};
};

using tier_t = tier<1>;

}  // namespace popchain::schema
