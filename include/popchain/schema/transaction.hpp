#pragma once
#include <popchain/schema/mint_certificate.hpp>
#include <popchain/schema/primitives.hpp>
#include <popchain/schema/transfer_certificate_to_wallet.hpp>
#include <popchain/schema/upsert_account.hpp>
#include <variant>

namespace popchain::schema {

using transaction_payload_t = std::variant<mint_certificate_t,
                                           transfer_certificate_to_wallet_t,
                                           upsert_account_t>;

template <uint16_t Version>
struct transaction;

template <>
struct transaction<1> final {
  uint16_t version{1};
  address_t sender{};
  transaction_payload_t payload{};
};

using transaction_t = transaction<1>;

}  // namespace popchain::schema
