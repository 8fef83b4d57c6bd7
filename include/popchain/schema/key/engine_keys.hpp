#pragma once

#include <popchain/schema/primitives.hpp>
#include <cstdint>
#include <string_view>

// Schema key type: engine keys.
// Certificate workflow: Canonical key prefixes and key codecs for accounts,
// certificate objects, custody and the audit event log.
namespace popchain::schema::key {

inline constexpr std::string_view kAccountKeyPrefix{"SYS|STATE|ACCOUNT|"};
inline constexpr std::string_view kCertificateKeyPrefix{"SYS|STATE|CERT|"};
inline constexpr std::string_view kCustodyKeyPrefix{"SYS|STATE|CUSTODY|"};
inline constexpr std::string_view kEventSeqKeyPrefix{"SYS|STATE|EVENT_SEQ|"};
inline constexpr std::string_view kEventPrefix{"SYS|EVENT|"};

template <typename Encoder, typename T>
popchain::schema::bytes_t make_prefixed_key(Encoder& encoder,
                                            std::string_view prefix,
                                            const T& id) {
  // SCALE product types are encoded as concatenated field bytes.
  // This is equivalent to encoding tuple{prefix, id}.
  auto key = encoder.encode(prefix);
  encoder.encode(id, key);
  return key;
}

template <typename Encoder>
popchain::schema::bytes_t make_prefix_key(Encoder& encoder,
                                          std::string_view prefix) {
  return encoder.encode(prefix);
}

template <typename Encoder>
popchain::schema::bytes_t make_account_key(
    Encoder& encoder,
    const popchain::schema::account_id_t& account_id) {
  return make_prefixed_key(encoder, kAccountKeyPrefix, account_id);
}

template <typename Encoder>
popchain::schema::bytes_t make_certificate_key(
    Encoder& encoder,
    const popchain::schema::object_id_t& certificate_id) {
  return make_prefixed_key(encoder, kCertificateKeyPrefix, certificate_id);
}

template <typename Encoder>
popchain::schema::bytes_t make_custody_key(
    Encoder& encoder,
    const popchain::schema::object_id_t& object_id) {
  return make_prefixed_key(encoder, kCustodyKeyPrefix, object_id);
}

template <typename Encoder>
popchain::schema::bytes_t make_event_sequence_key(Encoder& encoder) {
  return make_prefixed_key(encoder, kEventSeqKeyPrefix,
                           std::string_view{"NEXT"});
}

template <typename Encoder>
popchain::schema::bytes_t make_event_key(Encoder& encoder, uint64_t event_id) {
  return make_prefixed_key(encoder, kEventPrefix, event_id);
}

}  // namespace popchain::schema::key
