#pragma once

#include <popchain/execution/host_context.hpp>
#include <popchain/execution/ledger_context.hpp>
#include <popchain/schema/certificate.hpp>
#include <popchain/schema/primitives.hpp>
#include <popchain/schema/transaction_event.hpp>

#include <cstdint>
#include <utility>
#include <vector>

namespace popchain::testing {

/// Deterministic host context: fixed clock, sequential ids (1, 2, ...)
/// written into the last eight bytes, and recorded deliveries and events.
class fixed_context final : public popchain::execution::host_context {
 public:
  explicit fixed_context(const popchain::schema::timestamp_milliseconds_t now)
      : now_{now} {}

  popchain::schema::timestamp_milliseconds_t now() const override {
    return now_;
  }

  popchain::schema::object_id_t fresh_object_id() override {
    auto id = popchain::schema::object_id_t{};
    auto value = ++ids_created_;
    for (std::size_t i = 0; i < 8; ++i) {
      id[id.size() - 1 - i] = static_cast<uint8_t>(value >> (8 * i));
    }
    return id;
  }

  void deliver(popchain::schema::certificate_t&& certificate,
               const popchain::schema::address_t& recipient) override {
    deliveries_.push_back(popchain::execution::custody_delivery{
        .certificate = std::move(certificate), .recipient = recipient});
  }

  void emit(popchain::schema::transaction_event_t&& event) override {
    events_.push_back(std::move(event));
  }

  void set_now(const popchain::schema::timestamp_milliseconds_t now) {
    now_ = now;
  }

  const std::vector<popchain::execution::custody_delivery>& deliveries()
      const {
    return deliveries_;
  }

  const std::vector<popchain::schema::transaction_event_t>& events() const {
    return events_;
  }

 private:
  popchain::schema::timestamp_milliseconds_t now_{};
  uint64_t ids_created_{};
  std::vector<popchain::execution::custody_delivery> deliveries_;
  std::vector<popchain::schema::transaction_event_t> events_;
};

}  // namespace popchain::testing
