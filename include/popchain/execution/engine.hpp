#pragma once

#include <popchain/schema/account_state.hpp>
#include <popchain/schema/app_info.hpp>
#include <popchain/schema/certificate.hpp>
#include <popchain/schema/custody_record.hpp>
#include <popchain/schema/encoding/scale/encoder.hpp>
#include <popchain/schema/event_record.hpp>
#include <popchain/schema/primitives.hpp>
#include <popchain/schema/transaction.hpp>
#include <popchain/schema/transaction_result.hpp>
#include <popchain/storage/rocksdb/storage.hpp>
#include <cstdint>
#include <mutex>
#include <optional>
#include <vector>

namespace popchain::execution {

class ledger_context;

/// Host ledger adapter for certificate issuance and custody.
///
/// The engine decodes SCALE transactions, runs the matching operation against
/// a staged ledger_context and commits accounts, certificate objects, custody
/// records and audit events in one RocksDB write batch. A rejected
/// transaction leaves storage untouched.
class engine final {
 public:
  explicit engine(
      popchain::schema::encoding::encoder<
          popchain::schema::encoding::scale_encoder_tag>& encoder,
      popchain::storage::storage<popchain::storage::rocksdb_storage_tag>&
          storage);

  /// Decode, execute and commit one transaction at ledger time
  /// `block_time_ms`. Every public call, queries included, takes the engine
  /// lock, so readers never see a half applied transaction.
  popchain::schema::transaction_result_t execute(
      const popchain::schema::bytes_view_t& raw_tx,
      popchain::schema::timestamp_milliseconds_t block_time_ms);

  /// Return application metadata (last committed sequence and state_root).
  popchain::schema::app_info_t info() const;

  std::optional<popchain::schema::account_state_t> account(
      const popchain::schema::account_id_t& account_id) const;

  std::optional<popchain::schema::certificate_t> certificate(
      const popchain::schema::object_id_t& certificate_id) const;

  /// Current custody of a certificate object.
  std::optional<popchain::schema::custody_record_t> custody(
      const popchain::schema::object_id_t& certificate_id) const;

  /// All custody records whose holder is `holder`.
  std::vector<popchain::schema::custody_record_t> holdings(
      const popchain::schema::address_t& holder) const;

  /// Audit events with ids in the inclusive range [from_id, to_id].
  std::vector<popchain::schema::event_record_t> events(uint64_t from_id,
                                                       uint64_t to_id) const;

 private:
  popchain::schema::transaction_result_t execute_operation(
      const popchain::schema::transaction_t& tx,
      ledger_context& context,
      std::vector<popchain::storage::key_value_entry_t>& writes);

  popchain::schema::transaction_result_t execute_mint(
      const popchain::schema::mint_certificate_t& operation,
      ledger_context& context,
      std::vector<popchain::storage::key_value_entry_t>& writes);

  popchain::schema::transaction_result_t execute_transfer(
      const popchain::schema::address_t& sender,
      const popchain::schema::transfer_certificate_to_wallet_t& operation,
      ledger_context& context);

  popchain::schema::transaction_result_t execute_upsert_account(
      const popchain::schema::address_t& sender,
      const popchain::schema::upsert_account_t& operation,
      std::vector<popchain::storage::key_value_entry_t>& writes);

  // Unlocked reads for use while mutex_ is held.
  std::optional<popchain::schema::account_state_t> load_account(
      const popchain::schema::account_id_t& account_id) const;
  std::optional<popchain::schema::certificate_t> load_certificate(
      const popchain::schema::object_id_t& certificate_id) const;
  std::optional<popchain::schema::custody_record_t> load_custody(
      const popchain::schema::object_id_t& certificate_id) const;

  /// Load committed sequence, state_root and event counter at startup.
  void load_persisted_state();

  mutable std::mutex mutex_;
  popchain::schema::encoding::encoder<
      popchain::schema::encoding::scale_encoder_tag>& encoder_;
  popchain::storage::storage<popchain::storage::rocksdb_storage_tag>& storage_;
  uint64_t last_sequence_{};
  popchain::schema::hash32_t last_state_root_{};
  uint64_t next_event_id_{1};
};

}  // namespace popchain::execution
