#pragma once
#include <popchain/common/critical.hpp>
#include <popchain/schema/encoding/encoder.hpp>
#include <iterator>
#include <scale/scale.hpp>

// Schema types are plain aggregates built from integers, strings, byte
// arrays, optionals, vectors and variants; SCALE encodes them field by field
// in declaration order.
namespace popchain::schema::encoding {

struct scale_encoder_tag {};

template <>
struct encoder<scale_encoder_tag> final {
  template <typename T>
  popchain::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, popchain::schema::bytes_t& out);

  template <typename T>
  T decode(const popchain::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const popchain::schema::bytes_view_t& bytes);
};

template <typename T>
popchain::schema::bytes_t encoder<scale_encoder_tag>::encode(const T& obj) {
  auto encoded = ::scale::impl::memory::encode(obj);
  if (!encoded) {
    popchain::common::critical("failed to encode SCALE object");
  }
  return encoded.value();
}

template <typename T>
void encoder<scale_encoder_tag>::encode(const T& obj,
                                        popchain::schema::bytes_t& out) {
  auto encoded = encode(obj);
  out.insert(std::end(out), std::begin(encoded), std::end(encoded));
}

template <typename T>
T encoder<scale_encoder_tag>::decode(
    const popchain::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    popchain::common::critical("failed to decode SCALE bytes");
  }
  return decoded.value();
}

template <typename T>
std::optional<T> encoder<scale_encoder_tag>::try_decode(
    const popchain::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    return std::nullopt;
  }
  return decoded.value();
}

using scale_encoder_t = encoder<scale_encoder_tag>;

}  // namespace popchain::schema::encoding
