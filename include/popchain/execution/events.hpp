#pragma once

#include <popchain/schema/certificate.hpp>
#include <popchain/schema/primitives.hpp>
#include <popchain/schema/transaction_event.hpp>
#include <optional>
#include <string>
#include <string_view>

namespace popchain::execution {

inline constexpr std::string_view kCertificateMintedEvent{
    "certificate_minted"};
inline constexpr std::string_view kCertificateTransferredToWalletEvent{
    "certificate_transferred_to_wallet"};

// Attribute value used when a certificate was issued to an unlinked account.
inline constexpr std::string_view kUnlinkedAddress{"unlinked"};

popchain::schema::transaction_event_t make_certificate_minted_event(
    const popchain::schema::certificate_t& certificate);

popchain::schema::transaction_event_t
make_certificate_transferred_to_wallet_event(
    const popchain::schema::object_id_t& certificate_id,
    const popchain::schema::account_id_t& account_id,
    const popchain::schema::address_t& recipient);

/// Return the value of the first attribute named `key`.
std::optional<std::string> find_attribute(
    const popchain::schema::transaction_event_t& event,
    std::string_view key);

}  // namespace popchain::execution
