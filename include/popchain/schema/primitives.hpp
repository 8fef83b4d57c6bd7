#pragma once
#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace popchain::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using hash32_t = std::array<uint8_t, 32>;
using address_t = hash32_t;    // wallet address on the host ledger
using object_id_t = hash32_t;  // ledger-resident object identity
using account_id_t = hash32_t;
using event_id_t = hash32_t;  // opaque reference to an external event record
using timestamp_milliseconds_t = uint64_t;
using price_t = uint64_t;  // minor currency units

bytes_t make_bytes(const bytes_view_t& bytes);
bytes_t make_bytes(const std::string& bytes);
bytes_t make_bytes(const std::string_view& bytes);

bytes_view_t make_bytes_view(const bytes_t& bytes);
bytes_view_t make_bytes_view(const std::string& bytes);
bytes_view_t make_bytes_view(const std::string_view& bytes);

std::string make_string(const bytes_t& bytes);
std::string make_string(const bytes_view_t& bytes);

hash32_t make_hash32(const bytes_t& bytes);
hash32_t make_hash32(const std::string_view& hex);
std::optional<hash32_t> try_make_hash32(const std::string_view& hex);
hash32_t make_zero_hash();

/// Parse a hex address, left padding short forms such as `0xABC` with zeros.
std::optional<address_t> try_make_address(const std::string_view& hex);
address_t make_address(const std::string_view& hex);

std::string to_hex(const bytes_view_t& bytes);
std::string to_hex(const hash32_t& hash);
std::optional<bytes_t> try_from_hex(const std::string_view hex);
bytes_t from_hex(const std::string_view hex);

/// True when `bytes` is well formed UTF-8 (no overlongs, no surrogates).
bool is_utf8(const bytes_view_t& bytes);
/// True when every byte of `bytes` is 7-bit ASCII.
bool is_ascii(const bytes_view_t& bytes);

}  // namespace popchain::schema

template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;
