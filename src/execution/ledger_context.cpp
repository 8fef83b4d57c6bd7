#include <popchain/blake3/hash.hpp>
#include <popchain/execution/ledger_context.hpp>
#include <popchain/schema/encoding/scale/encoder.hpp>

#include <utility>

using namespace popchain::schema;

namespace popchain::execution {

ledger_context::ledger_context(const hash32_t& digest,
                               timestamp_milliseconds_t now)
    : digest_{digest}, now_{now} {}

timestamp_milliseconds_t ledger_context::now() const {
  return now_;
}

object_id_t ledger_context::fresh_object_id() {
  // id = BLAKE3(tx digest || SCALE(creation counter))
  auto encoder = encoding::scale_encoder_t{};
  auto counter = encoder.encode(ids_created_);
  ++ids_created_;
  return popchain::blake3::hash({digest_, counter});
}

void ledger_context::deliver(certificate_t&& certificate,
                             const address_t& recipient) {
  deliveries_.push_back(
      custody_delivery{.certificate = std::move(certificate),
                       .recipient = recipient});
}

void ledger_context::emit(transaction_event_t&& event) {
  events_.push_back(std::move(event));
}

}  // namespace popchain::execution
