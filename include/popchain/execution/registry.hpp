#pragma once

#include <popchain/execution/host_context.hpp>
#include <popchain/schema/account_state.hpp>
#include <popchain/schema/certificate.hpp>
#include <popchain/schema/primitives.hpp>
#include <popchain/schema/tier.hpp>
#include <popchain/schema/url.hpp>
#include <optional>
#include <string>
#include <string_view>

namespace popchain::execution {

inline constexpr std::string_view kMintCodespace{"popchain.mint"};

/// Mint a certificate of `tier` for `event_id` and issue it to `account`.
///
/// `issued_to` records the account owner as read now, empty when the account
/// has no linked wallet. Custody goes to that owner, or to `service_wallet`
/// as escrow when there is none. The new id is appended to the account and a
/// `certificate_minted` event is emitted. The tier is consumed.
///
/// Price is recorded only; collecting it is the caller's job.
popchain::schema::object_id_t mint_certificate(
    const popchain::schema::event_id_t& event_id,
    popchain::schema::url_t url,
    popchain::schema::tier_t&& tier,
    popchain::schema::account_state_t& account,
    const popchain::schema::address_t& service_wallet,
    host_context& context);

inline const popchain::schema::event_id_t& get_event_id(
    const popchain::schema::certificate_t& certificate) {
  return certificate.event_id;
}

inline const std::string& get_tier_name(
    const popchain::schema::certificate_t& certificate) {
  return certificate.tier_name;
}

inline const popchain::schema::url_t& get_url(
    const popchain::schema::certificate_t& certificate) {
  return certificate.url;
}

inline const popchain::schema::url_t& get_tier_url(
    const popchain::schema::certificate_t& certificate) {
  return certificate.tier_url;
}

inline const std::optional<popchain::schema::address_t>& get_issued_to(
    const popchain::schema::certificate_t& certificate) {
  return certificate.issued_to;
}

inline popchain::schema::timestamp_milliseconds_t get_issued_at(
    const popchain::schema::certificate_t& certificate) {
  return certificate.issued_at;
}

inline popchain::schema::price_t get_mint_price(
    const popchain::schema::certificate_t& certificate) {
  return certificate.mint_price;
}

}  // namespace popchain::execution
