#include <popchain/common/critical.hpp>
#include <popchain/schema/primitives.hpp>

#include <algorithm>
#include <iterator>
#include <string_view>

namespace popchain::schema {

namespace {

std::string_view normalize_hex(std::string_view input) {
  if (input.size() >= 2 && input[0] == '0' &&
      (input[1] == 'x' || input[1] == 'X')) {
    input.remove_prefix(2);
  }
  return input;
}

std::optional<uint8_t> hex_nibble(const char c) {
  if (c >= '0' && c <= '9') {
    return static_cast<uint8_t>(c - '0');
  }
  if (c >= 'a' && c <= 'f') {
    return static_cast<uint8_t>(c - 'a' + 10);
  }
  if (c >= 'A' && c <= 'F') {
    return static_cast<uint8_t>(c - 'A' + 10);
  }
  return std::nullopt;
}

std::optional<bytes_t> try_from_hex_internal(std::string_view hex) {
  hex = normalize_hex(hex);
  if ((hex.size() % 2) != 0) {
    return std::nullopt;
  }

  auto decoded = bytes_t{};
  decoded.reserve(hex.size() / 2);
  for (size_t i = 0; i < hex.size(); i += 2) {
    auto high = hex_nibble(hex[i]);
    auto low = hex_nibble(hex[i + 1]);
    if (!high || !low) {
      return std::nullopt;
    }
    decoded.push_back(static_cast<uint8_t>((*high << 4u) | *low));
  }
  return decoded;
}

std::optional<hash32_t> try_make_hash32_internal(std::string_view hex) {
  auto decoded = try_from_hex_internal(hex);
  if (!decoded || decoded->size() != 32) {
    return std::nullopt;
  }

  auto hash = hash32_t{};
  std::copy(decoded->begin(), decoded->end(), hash.begin());
  return hash;
}

// Length of the UTF-8 sequence introduced by `lead`, 0 when invalid.
std::size_t utf8_sequence_length(const uint8_t lead) {
  if (lead < 0x80u) {
    return 1;
  }
  if (lead >= 0xC2u && lead <= 0xDFu) {
    return 2;
  }
  if (lead >= 0xE0u && lead <= 0xEFu) {
    return 3;
  }
  if (lead >= 0xF0u && lead <= 0xF4u) {
    return 4;
  }
  return 0;
}

}  // namespace

bytes_t make_bytes(const bytes_view_t& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_t make_bytes(const std::string& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_t make_bytes(const std::string_view& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_view_t make_bytes_view(const bytes_t& bytes) {
  return bytes_view_t{bytes};
}

bytes_view_t make_bytes_view(const std::string& bytes) {
  return bytes_view_t{reinterpret_cast<const uint8_t*>(bytes.c_str()),
                      bytes.size()};
}

bytes_view_t make_bytes_view(const std::string_view& bytes) {
  return bytes_view_t{reinterpret_cast<const uint8_t*>(bytes.data()),
                      bytes.size()};
}

std::string make_string(const bytes_t& bytes) {
  return std::string{reinterpret_cast<const char*>(bytes.data()), bytes.size()};
}

std::string make_string(const bytes_view_t& bytes) {
  return std::string{reinterpret_cast<const char*>(bytes.data()), bytes.size()};
}

hash32_t make_hash32(const bytes_t& bytes) {
  if (bytes.size() != 32) {
    popchain::common::critical("make_hash32 expected exactly 32 bytes");
  }
  auto hash = hash32_t{};
  std::copy(std::begin(bytes), std::end(bytes), std::begin(hash));
  return hash;
}

hash32_t make_hash32(const std::string_view& hex) {
  auto hash = try_make_hash32_internal(hex);
  if (!hash.has_value()) {
    popchain::common::critical("make_hash32 expected 64 hex characters");
  }
  return *hash;
}

std::optional<hash32_t> try_make_hash32(const std::string_view& hex) {
  return try_make_hash32_internal(hex);
}

hash32_t make_zero_hash() {
  return {};
}

std::optional<address_t> try_make_address(const std::string_view& hex) {
  auto digits = normalize_hex(hex);
  if (digits.empty() || digits.size() > 64) {
    return std::nullopt;
  }
  auto padded = std::string(64 - digits.size(), '0');
  padded.append(digits);
  return try_make_hash32_internal(padded);
}

address_t make_address(const std::string_view& hex) {
  auto address = try_make_address(hex);
  if (!address.has_value()) {
    popchain::common::critical("invalid address input");
  }
  return *address;
}

std::string to_hex(const bytes_view_t& bytes) {
  static constexpr auto kHex = std::string_view{"0123456789abcdef"};
  auto out = std::string{};
  out.resize(bytes.size() * 2);
  for (std::size_t i = 0; i < bytes.size(); ++i) {
    out[(2 * i)] = kHex[(bytes[i] >> 4u) & 0x0Fu];
    out[(2 * i) + 1] = kHex[bytes[i] & 0x0Fu];
  }
  return out;
}

std::string to_hex(const hash32_t& hash) {
  return "0x" + to_hex(bytes_view_t{hash.data(), hash.size()});
}

std::optional<bytes_t> try_from_hex(const std::string_view hex) {
  return try_from_hex_internal(hex);
}

bytes_t from_hex(const std::string_view hex) {
  auto decoded = try_from_hex_internal(hex);
  if (!decoded.has_value()) {
    popchain::common::critical("invalid hex input");
  }
  return *decoded;
}

bool is_utf8(const bytes_view_t& bytes) {
  auto index = std::size_t{0};
  while (index < bytes.size()) {
    auto lead = bytes[index];
    auto length = utf8_sequence_length(lead);
    if (length == 0 || (index + length) > bytes.size()) {
      return false;
    }
    for (std::size_t i = 1; i < length; ++i) {
      if ((bytes[index + i] & 0xC0u) != 0x80u) {
        return false;
      }
    }
    if (length >= 3) {
      auto second = bytes[index + 1];
      if (lead == 0xE0u && second < 0xA0u) {
        return false;  // overlong
      }
      if (lead == 0xEDu && second >= 0xA0u) {
        return false;  // surrogate
      }
      if (lead == 0xF0u && second < 0x90u) {
        return false;  // overlong
      }
      if (lead == 0xF4u && second >= 0x90u) {
        return false;  // above U+10FFFF
      }
    }
    index += length;
  }
  return true;
}

bool is_ascii(const bytes_view_t& bytes) {
  return std::ranges::all_of(bytes,
                             [](const uint8_t byte) { return byte < 0x80u; });
}

}  // namespace popchain::schema
