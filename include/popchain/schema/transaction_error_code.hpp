#pragma once

#include <algorithm>
#include <array>
#include <iterator>
#include <cstdint>
#include <optional>
#include <string_view>
#include <utility>

namespace popchain::schema {

enum class transaction_error_code : uint32_t {
  invalid_transaction = 1,
  unsupported_transaction_version = 2,
  invalid_address = 10,
  unauthorized = 11,
  length_mismatch = 12,
  encoding_failure = 13,
  account_missing = 20,
  certificate_missing = 21,
  custody_mismatch = 22,
  account_already_linked = 23,
};

inline constexpr auto kTransactionErrorCodeMappings = std::array{
    std::pair<std::string_view, transaction_error_code>{
        "invalid_transaction", transaction_error_code::invalid_transaction},
    std::pair<std::string_view, transaction_error_code>{
        "unsupported_transaction_version",
        transaction_error_code::unsupported_transaction_version},
    std::pair<std::string_view, transaction_error_code>{
        "invalid_address", transaction_error_code::invalid_address},
    std::pair<std::string_view, transaction_error_code>{
        "unauthorized", transaction_error_code::unauthorized},
    std::pair<std::string_view, transaction_error_code>{
        "length_mismatch", transaction_error_code::length_mismatch},
    std::pair<std::string_view, transaction_error_code>{
        "encoding_failure", transaction_error_code::encoding_failure},
    std::pair<std::string_view, transaction_error_code>{
        "account_missing", transaction_error_code::account_missing},
    std::pair<std::string_view, transaction_error_code>{
        "certificate_missing", transaction_error_code::certificate_missing},
    std::pair<std::string_view, transaction_error_code>{
        "custody_mismatch", transaction_error_code::custody_mismatch},
    std::pair<std::string_view, transaction_error_code>{
        "account_already_linked",
        transaction_error_code::account_already_linked}};

/// Parse a code from its snake_case name.
inline constexpr std::optional<transaction_error_code> try_from_string(
    const std::string_view name) {
  auto found = std::ranges::find(
      kTransactionErrorCodeMappings, name,
      &std::pair<std::string_view, transaction_error_code>::first);
  if (found == std::end(kTransactionErrorCodeMappings)) {
    return std::nullopt;
  }
  return found->second;
}

inline constexpr std::string_view to_string(
    const transaction_error_code value) {
  auto found = std::ranges::find(
      kTransactionErrorCodeMappings, value,
      &std::pair<std::string_view, transaction_error_code>::second);
  if (found == std::end(kTransactionErrorCodeMappings)) {
    return "unknown";
  }
  return found->first;
}

inline constexpr uint32_t to_code(const transaction_error_code value) {
  return static_cast<uint32_t>(value);
}

}  // namespace popchain::schema
