#include <popchain/execution/authorizer.hpp>
#include <popchain/execution/events.hpp>
#include <popchain/schema/transaction_error_code.hpp>

#include <spdlog/spdlog.h>
#include <algorithm>
#include <iterator>
#include <string>
#include <utility>

using namespace popchain::schema;

namespace {

transaction_result_t make_error(const transaction_error_code code,
                                std::string log) {
  auto result = transaction_result_t{};
  result.code = to_code(code);
  result.log = std::move(log);
  result.info = std::string{to_string(code)};
  result.codespace = std::string{popchain::execution::kTransferCodespace};
  return result;
}

}  // namespace

namespace popchain::execution {

transaction_result_t transfer_certificate_to_wallet(
    account_state_t& account,
    certificate_t&& certificate,
    host_context& context) {
  if (!account.owner.has_value()) {
    return make_error(
        transaction_error_code::invalid_address,
        "account not linked to a wallet cannot receive a direct transfer");
  }
  auto recipient = *account.owner;

  if (certificate.issued_to.has_value() &&
      *certificate.issued_to != recipient) {
    return make_error(
        transaction_error_code::unauthorized,
        "certificate's recorded recipient differs from this account");
  }

  auto registered =
      std::find(std::begin(account.certificate_ids),
                std::end(account.certificate_ids), certificate.id);
  if (registered == std::end(account.certificate_ids)) {
    return make_error(transaction_error_code::unauthorized,
                      "certificate not registered to this account");
  }

  auto certificate_id = certificate.id;
  spdlog::info("Releasing certificate {} to wallet {} of account {}",
               to_hex(certificate_id), to_hex(recipient),
               to_hex(account.account_id));
  context.deliver(std::move(certificate), recipient);
  context.emit(make_certificate_transferred_to_wallet_event(
      certificate_id, account.account_id, recipient));

  auto result = transaction_result_t{};
  result.data = make_bytes(bytes_view_t{certificate_id});
  result.codespace = std::string{kTransferCodespace};
  return result;
}

}  // namespace popchain::execution
