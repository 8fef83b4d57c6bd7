#include <spdlog/spdlog.h>
#include <popchain/blake3/hash.hpp>
#include <popchain/catalog/tier_catalog.hpp>
#include <popchain/execution/authorizer.hpp>
#include <popchain/execution/engine.hpp>
#include <popchain/execution/ledger_context.hpp>
#include <popchain/execution/registry.hpp>
#include <popchain/schema/error.hpp>
#include <popchain/schema/key/engine_keys.hpp>
#include <popchain/schema/transaction_error_code.hpp>
#include <exception>
#include <iterator>
#include <string>
#include <string_view>
#include <tuple>
#include <utility>

using namespace popchain::schema;

namespace {

using encoder_t = popchain::schema::encoding::scale_encoder_t;

inline constexpr std::string_view kExecuteCodespace{"popchain.execute"};
inline constexpr std::string_view kAccountCodespace{"popchain.account"};

transaction_result_t make_error(const transaction_error_code code,
                                std::string log,
                                const std::string_view codespace) {
  auto result = transaction_result_t{};
  result.code = to_code(code);
  result.log = std::move(log);
  result.info = std::string{to_string(code)};
  result.codespace = std::string{codespace};
  return result;
}

transaction_result_t make_error(const failure_t& error,
                                const std::string_view codespace) {
  return make_error(error.code, error.message, codespace);
}

bytes_t encode_sequence(const uint64_t sequence) {
  auto encoder = encoder_t{};
  return encoder.encode(sequence);
}

// digest = BLAKE3(raw_tx || SCALE(sequence))
hash32_t make_transaction_digest(const bytes_view_t& raw_tx,
                                 const uint64_t sequence) {
  auto encoded_sequence = encode_sequence(sequence);
  return popchain::blake3::hash({raw_tx, encoded_sequence});
}

// root' = BLAKE3(root || raw_tx || SCALE(sequence))
hash32_t fold_state_root(const hash32_t& seed,
                         const bytes_view_t& raw_tx,
                         const uint64_t sequence) {
  auto encoded_sequence = encode_sequence(sequence);
  return popchain::blake3::hash({seed, raw_tx, encoded_sequence});
}

std::optional<transaction_t> decode_transaction(const bytes_view_t& raw_tx,
                                                std::string& error) {
  if (raw_tx.empty()) {
    error = "empty transaction";
    return std::nullopt;
  }
  try {
    auto encoder = encoder_t{};
    auto tx = encoder.try_decode<transaction_t>(raw_tx);
    if (!tx.has_value()) {
      error = "malformed SCALE transaction";
    }
    return tx;
  } catch (const std::exception& ex) {
    error = ex.what();
    return std::nullopt;
  }
}

template <typename T>
void stage(std::vector<popchain::storage::key_value_entry_t>& writes,
           bytes_t key,
           const T& value) {
  auto encoder = encoder_t{};
  writes.emplace_back(std::move(key), encoder.encode(value));
}

}  // namespace

namespace popchain::execution {

engine::engine(encoder_t& encoder,
               popchain::storage::storage<popchain::storage::rocksdb_storage_tag>&
                   storage)
    : encoder_{encoder}, storage_{storage} {
  auto lock = std::scoped_lock{mutex_};
  load_persisted_state();
  spdlog::info("Certificate ledger ready at sequence {}, next event id {}",
               last_sequence_, next_event_id_);
}

transaction_result_t engine::execute(const bytes_view_t& raw_tx,
                                     timestamp_milliseconds_t block_time_ms) {
  auto lock = std::scoped_lock{mutex_};

  auto decode_error = std::string{};
  auto maybe_tx = decode_transaction(raw_tx, decode_error);
  if (!maybe_tx) {
    spdlog::warn("Rejecting undecodable transaction: {}", decode_error);
    return make_error(transaction_error_code::invalid_transaction,
                      decode_error, kExecuteCodespace);
  }
  if (maybe_tx->version != 1) {
    spdlog::warn("Rejecting transaction with version {}", maybe_tx->version);
    return make_error(transaction_error_code::unsupported_transaction_version,
                      "expected version 1", kExecuteCodespace);
  }

  auto sequence = last_sequence_ + 1;
  auto context =
      ledger_context{make_transaction_digest(raw_tx, sequence), block_time_ms};
  auto writes = std::vector<popchain::storage::key_value_entry_t>{};

  auto result = execute_operation(*maybe_tx, context, writes);
  if (result.code != 0) {
    spdlog::warn("Transaction rejected [{}] {}: {}", result.codespace,
                 result.info, result.log);
    return result;
  }

  for (auto& delivery : context.deliveries()) {
    auto object_id = delivery.certificate.id;
    stage(writes, key::make_custody_key(encoder_, object_id),
          custody_record_t{.object_id = object_id,
                           .holder = delivery.recipient,
                           .since = block_time_ms});
    stage(writes, key::make_certificate_key(encoder_, object_id),
          delivery.certificate);
  }

  auto next_event_id = next_event_id_;
  for (const auto& event : context.events()) {
    auto record = event_record_t{.event_id = next_event_id,
                                 .sequence = sequence,
                                 .recorded_at = block_time_ms,
                                 .event = event};
    stage(writes, key::make_event_key(encoder_, next_event_id), record);
    ++next_event_id;
  }
  if (next_event_id != next_event_id_) {
    stage(writes, key::make_event_sequence_key(encoder_), next_event_id);
  }

  auto state_root = fold_state_root(last_state_root_, raw_tx, sequence);
  storage_.commit(writes, popchain::storage::committed_state{
                              .sequence = sequence, .state_root = state_root});

  last_sequence_ = sequence;
  last_state_root_ = state_root;
  next_event_id_ = next_event_id;
  result.events = std::move(context.events());
  return result;
}

transaction_result_t engine::execute_operation(
    const transaction_t& tx,
    ledger_context& context,
    std::vector<popchain::storage::key_value_entry_t>& writes) {
  auto result = transaction_result_t{};
  std::visit(
      overloaded{[&](const mint_certificate_t& operation) {
                   result = execute_mint(operation, context, writes);
                 },
                 [&](const transfer_certificate_to_wallet_t& operation) {
                   result = execute_transfer(tx.sender, operation, context);
                 },
                 [&](const upsert_account_t& operation) {
                   result = execute_upsert_account(tx.sender, operation, writes);
                 }},
      tx.payload);
  return result;
}

transaction_result_t engine::execute_mint(
    const mint_certificate_t& operation,
    ledger_context& context,
    std::vector<popchain::storage::key_value_entry_t>& writes) {
  auto maybe_account = load_account(operation.account_id);
  if (!maybe_account) {
    return make_error(transaction_error_code::account_missing,
                      "attendee account does not exist", kMintCodespace);
  }

  auto error = failure_t{};
  auto tier = popchain::catalog::create_tier_from_bytes(
      operation.tier_name, operation.tier_description, operation.tier_url,
      operation.price, error);
  if (!tier) {
    return make_error(error, kMintCodespace);
  }
  if (!is_ascii(operation.url)) {
    return make_error(transaction_error_code::encoding_failure,
                      "metadata url is not ASCII", kMintCodespace);
  }

  auto certificate_id = mint_certificate(
      operation.event_id, url_t{make_string(operation.url)}, std::move(*tier),
      *maybe_account, operation.service_wallet, context);
  stage(writes, key::make_account_key(encoder_, operation.account_id),
        *maybe_account);

  auto result = transaction_result_t{};
  result.data = make_bytes(bytes_view_t{certificate_id});
  result.info = "certificate minted";
  result.codespace = std::string{kMintCodespace};
  return result;
}

transaction_result_t engine::execute_transfer(
    const address_t& sender,
    const transfer_certificate_to_wallet_t& operation,
    ledger_context& context) {
  auto maybe_account = load_account(operation.account_id);
  if (!maybe_account) {
    return make_error(transaction_error_code::account_missing,
                      "account does not exist", kTransferCodespace);
  }
  auto maybe_certificate = load_certificate(operation.certificate_id);
  auto maybe_custody = load_custody(operation.certificate_id);
  if (!maybe_certificate || !maybe_custody) {
    return make_error(transaction_error_code::certificate_missing,
                      "certificate does not exist", kTransferCodespace);
  }
  // Only the current custodian can hand the object over.
  if (maybe_custody->holder != sender) {
    return make_error(transaction_error_code::custody_mismatch,
                      "sender does not hold this certificate",
                      kTransferCodespace);
  }

  auto result = transfer_certificate_to_wallet(
      *maybe_account, std::move(*maybe_certificate), context);
  if (result.code == 0) {
    result.info = "certificate transferred to wallet";
  }
  return result;
}

transaction_result_t engine::execute_upsert_account(
    const address_t& sender,
    const upsert_account_t& operation,
    std::vector<popchain::storage::key_value_entry_t>& writes) {
  auto state = load_account(operation.account_id)
                   .value_or(account_state_t{.account_id = operation.account_id});
  if (state.owner.has_value() && state.owner != operation.owner) {
    return make_error(transaction_error_code::account_already_linked,
                      "account is already linked to a different wallet",
                      kAccountCodespace);
  }
  // A wallet can only be linked by itself.
  if (operation.owner.has_value() && *operation.owner != sender) {
    return make_error(transaction_error_code::unauthorized,
                      "only the wallet being linked may link it",
                      kAccountCodespace);
  }
  state.owner = operation.owner;
  stage(writes, key::make_account_key(encoder_, operation.account_id), state);
  spdlog::debug("Upserted account {} (linked: {})",
                to_hex(operation.account_id), state.owner.has_value());

  auto result = transaction_result_t{};
  result.info = "account upserted";
  result.codespace = std::string{kAccountCodespace};
  return result;
}

app_info_t engine::info() const {
  auto lock = std::scoped_lock{mutex_};
  auto result = app_info_t{};
  result.last_sequence = last_sequence_;
  result.last_state_root = last_state_root_;
  return result;
}

std::optional<account_state_t> engine::account(
    const account_id_t& account_id) const {
  auto lock = std::scoped_lock{mutex_};
  return load_account(account_id);
}

std::optional<certificate_t> engine::certificate(
    const object_id_t& certificate_id) const {
  auto lock = std::scoped_lock{mutex_};
  return load_certificate(certificate_id);
}

std::optional<custody_record_t> engine::custody(
    const object_id_t& certificate_id) const {
  auto lock = std::scoped_lock{mutex_};
  return load_custody(certificate_id);
}

std::vector<custody_record_t> engine::holdings(const address_t& holder) const {
  auto lock = std::scoped_lock{mutex_};
  auto prefix = key::make_prefix_key(encoder_, key::kCustodyKeyPrefix);
  auto rows =
      storage_.list_by_prefix(bytes_view_t{prefix.data(), prefix.size()});
  auto records = std::vector<custody_record_t>{};
  for (const auto& [row_key, row_value] : rows) {
    // Undecodable rows are corruption and go through critical, like get().
    auto record = encoder_.decode<custody_record_t>(
        bytes_view_t{row_value.data(), row_value.size()});
    if (record.holder == holder) {
      records.push_back(std::move(record));
    }
  }
  return records;
}

std::optional<account_state_t> engine::load_account(
    const account_id_t& account_id) const {
  auto key = key::make_account_key(encoder_, account_id);
  return storage_.get<account_state_t>(encoder_,
                                       bytes_view_t{key.data(), key.size()});
}

std::optional<certificate_t> engine::load_certificate(
    const object_id_t& certificate_id) const {
  auto key = key::make_certificate_key(encoder_, certificate_id);
  return storage_.get<certificate_t>(encoder_,
                                     bytes_view_t{key.data(), key.size()});
}

std::optional<custody_record_t> engine::load_custody(
    const object_id_t& certificate_id) const {
  auto key = key::make_custody_key(encoder_, certificate_id);
  return storage_.get<custody_record_t>(encoder_,
                                        bytes_view_t{key.data(), key.size()});
}

std::vector<event_record_t> engine::events(uint64_t from_id,
                                           uint64_t to_id) const {
  auto lock = std::scoped_lock{mutex_};
  auto records = std::vector<event_record_t>{};
  if (from_id == 0) {
    from_id = 1;
  }
  if (to_id >= next_event_id_) {
    to_id = next_event_id_ - 1;
  }
  for (auto id = from_id; id <= to_id; ++id) {
    auto key = key::make_event_key(encoder_, id);
    auto record = storage_.get<event_record_t>(
        encoder_, bytes_view_t{key.data(), key.size()});
    if (record.has_value()) {
      records.push_back(std::move(*record));
    }
  }
  return records;
}

void engine::load_persisted_state() {
  spdlog::debug("Loading persisted ledger state");
  if (auto committed = storage_.load_committed_state()) {
    last_sequence_ = committed->sequence;
    last_state_root_ = committed->state_root;
  }
  auto key = key::make_event_sequence_key(encoder_);
  if (auto next = storage_.get<uint64_t>(encoder_,
                                         bytes_view_t{key.data(), key.size()})) {
    next_event_id_ = *next;
  }
}

}  // namespace popchain::execution
