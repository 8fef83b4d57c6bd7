#pragma once

#include <popchain/schema/certificate.hpp>
#include <popchain/schema/primitives.hpp>
#include <popchain/schema/transaction_event.hpp>

namespace popchain::execution {

/// Capabilities the host ledger lends to a running operation.
///
/// Operations never touch storage directly: they read time, allocate ids,
/// hand objects to a new custodian and publish audit events through this
/// interface. The engine stages everything and commits it atomically; tests
/// inject a deterministic implementation.
class host_context {
 public:
  virtual ~host_context() = default;

  /// Current ledger time in milliseconds since the epoch.
  virtual popchain::schema::timestamp_milliseconds_t now() const = 0;

  /// Allocate an object id never handed out before.
  virtual popchain::schema::object_id_t fresh_object_id() = 0;

  /// Give exclusive custody of `certificate` to `recipient`.
  virtual void deliver(popchain::schema::certificate_t&& certificate,
                       const popchain::schema::address_t& recipient) = 0;

  /// Publish an audit event. No acknowledgement is returned.
  virtual void emit(popchain::schema::transaction_event_t&& event) = 0;
};

}  // namespace popchain::execution
