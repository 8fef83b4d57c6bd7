#include <popchain/execution/events.hpp>

#include <algorithm>
#include <iterator>
#include <string>
#include <utility>

using namespace popchain::schema;

namespace {

transaction_event_attribute_t make_attribute(std::string_view key,
                                             std::string value,
                                             bool index = false) {
  return transaction_event_attribute_t{
      .key = std::string{key}, .value = std::move(value), .index = index};
}

std::string format_issued_to(const std::optional<address_t>& issued_to) {
  if (!issued_to.has_value()) {
    return std::string{popchain::execution::kUnlinkedAddress};
  }
  return to_hex(*issued_to);
}

}  // namespace

namespace popchain::execution {

transaction_event_t make_certificate_minted_event(
    const certificate_t& certificate) {
  auto event = transaction_event_t{};
  event.type = std::string{kCertificateMintedEvent};
  event.attributes = {
      make_attribute("certificate_id", to_hex(certificate.id), true),
      make_attribute("event_id", to_hex(certificate.event_id), true),
      make_attribute("tier_name", certificate.tier_name),
      make_attribute("issued_to", format_issued_to(certificate.issued_to),
                     true),
      make_attribute("issued_at", std::to_string(certificate.issued_at)),
      make_attribute("mint_price", std::to_string(certificate.mint_price))};
  return event;
}

transaction_event_t make_certificate_transferred_to_wallet_event(
    const object_id_t& certificate_id,
    const account_id_t& account_id,
    const address_t& recipient) {
  auto event = transaction_event_t{};
  event.type = std::string{kCertificateTransferredToWalletEvent};
  event.attributes = {
      make_attribute("certificate_id", to_hex(certificate_id), true),
      make_attribute("account_id", to_hex(account_id), true),
      make_attribute("recipient", to_hex(recipient), true)};
  return event;
}

std::optional<std::string> find_attribute(const transaction_event_t& event,
                                          std::string_view key) {
  auto found = std::find_if(
      std::begin(event.attributes), std::end(event.attributes),
      [&](const transaction_event_attribute_t& attribute) {
        return attribute.key == key;
      });
  if (found == std::end(event.attributes)) {
    return std::nullopt;
  }
  return found->value;
}

}  // namespace popchain::execution
