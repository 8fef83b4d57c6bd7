#pragma once

#include <popchain/execution/host_context.hpp>
#include <popchain/schema/certificate.hpp>
#include <popchain/schema/primitives.hpp>
#include <popchain/schema/transaction_event.hpp>
#include <cstdint>
#include <vector>

namespace popchain::execution {

/// A certificate handed to a new custodian inside one transaction.
struct custody_delivery final {
  popchain::schema::certificate_t certificate;
  popchain::schema::address_t recipient{};
};

/// Host context backing one engine transaction.
///
/// Deliveries and events are only staged here. The engine commits them after
/// the operation succeeds and drops the context otherwise.
class ledger_context final : public host_context {
 public:
  /// `digest` identifies the transaction; object ids derive from it.
  ledger_context(const popchain::schema::hash32_t& digest,
                 popchain::schema::timestamp_milliseconds_t now);

  popchain::schema::timestamp_milliseconds_t now() const override;
  popchain::schema::object_id_t fresh_object_id() override;
  void deliver(popchain::schema::certificate_t&& certificate,
               const popchain::schema::address_t& recipient) override;
  void emit(popchain::schema::transaction_event_t&& event) override;

  std::vector<custody_delivery>& deliveries() { return deliveries_; }
  std::vector<popchain::schema::transaction_event_t>& events() {
    return events_;
  }

 private:
  popchain::schema::hash32_t digest_;
  popchain::schema::timestamp_milliseconds_t now_{};
  uint64_t ids_created_{};
  std::vector<custody_delivery> deliveries_;
  std::vector<popchain::schema::transaction_event_t> events_;
};

}  // namespace popchain::execution
