#pragma once

#include <compare>
#include <string>

// Schema type: url.
// Certificate workflow: ASCII resource locator for certificate metadata and
// tier artwork. Content behind the locator is stored off ledger.
namespace popchain::schema {

struct url_t final {
  std::string value;

  auto operator<=>(const url_t&) const = default;
};

}  // namespace popchain::schema
