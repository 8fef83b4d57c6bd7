#pragma once

#include <popchain/execution/host_context.hpp>
#include <popchain/schema/account_state.hpp>
#include <popchain/schema/certificate.hpp>
#include <popchain/schema/transaction_result.hpp>
#include <string_view>

namespace popchain::execution {

inline constexpr std::string_view kTransferCodespace{"popchain.transfer"};

/// Deliver `certificate` to the wallet linked to `account`.
///
/// Checks run in order and the first failure rejects the call:
///   1. the account has a linked owner, else `invalid_address`;
///   2. `issued_to` is empty or equals that owner, else `unauthorized`;
///   3. the certificate id is in the account's list, else `unauthorized`.
/// On rejection the certificate is left untouched in the caller's hands and
/// nothing is emitted. On success custody moves to the owner; `issued_to`
/// keeps its mint time value.
popchain::schema::transaction_result_t transfer_certificate_to_wallet(
    popchain::schema::account_state_t& account,
    popchain::schema::certificate_t&& certificate,
    host_context& context);

}  // namespace popchain::execution
