#pragma once
#include <popchain/schema/primitives.hpp>
#include <initializer_list>
#include <string_view>

namespace popchain::blake3 {

popchain::schema::hash32_t hash(const std::string_view& str);
popchain::schema::hash32_t hash(const popchain::schema::bytes_view_t& bytes);

/// Hash the concatenation of `parts` without materializing it.
popchain::schema::hash32_t hash(
    std::initializer_list<popchain::schema::bytes_view_t> parts);

}  // namespace popchain::blake3
