#pragma once
#include <popchain/schema/primitives.hpp>
#include <optional>
#include <span>

namespace popchain::schema::encoding {

// The codec library is a build time choice selected by tag, e.g.
// encoder<scale_encoder_tag>. Hot swapping is not a goal.
template <typename Library>
struct encoder {
  template <typename T>
  popchain::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, popchain::schema::bytes_t& out);

  template <typename T>
  T decode(const popchain::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const popchain::schema::bytes_view_t& bytes);
};

}  // namespace popchain::schema::encoding
