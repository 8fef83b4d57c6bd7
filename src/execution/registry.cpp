#include <popchain/execution/events.hpp>
#include <popchain/execution/registry.hpp>

#include <spdlog/spdlog.h>
#include <utility>

using namespace popchain::schema;

namespace popchain::execution {

object_id_t mint_certificate(const event_id_t& event_id,
                             url_t url,
                             tier_t&& tier,
                             account_state_t& account,
                             const address_t& service_wallet,
                             host_context& context) {
  auto issued_at = context.now();
  auto owner = account.owner;

  auto certificate = certificate_t{.id = context.fresh_object_id(),
                                   .event_id = event_id,
                                   .tier_name = std::move(tier.name),
                                   .url = std::move(url),
                                   .tier_url = std::move(tier.url),
                                   .issued_to = owner,
                                   .issued_at = issued_at,
                                   .mint_price = tier.price};
  auto certificate_id = certificate.id;
  auto minted = make_certificate_minted_event(certificate);

  // Accounts without a wallet are served from escrow until they link one.
  auto custodian = owner.value_or(service_wallet);
  spdlog::info("Minting {} certificate {} for account {} into custody of {}{}",
               certificate.tier_name, to_hex(certificate_id),
               to_hex(account.account_id), to_hex(custodian),
               owner.has_value() ? "" : " (escrow)");
  context.deliver(std::move(certificate), custodian);

  account.certificate_ids.push_back(certificate_id);
  context.emit(std::move(minted));
  return certificate_id;
}

}  // namespace popchain::execution
