#pragma once

#include <popchain/schema/error.hpp>
#include <popchain/schema/primitives.hpp>
#include <popchain/schema/tier.hpp>
#include <popchain/schema/url.hpp>
#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace popchain::catalog {

inline constexpr std::string_view kCodespace{"popchain.catalog"};

inline constexpr std::size_t kDefaultTierCount{4};

/// Build a tier from already decoded fields. No validation.
popchain::schema::tier_t create_tier(std::string name,
                                     std::string description,
                                     popchain::schema::url_t url,
                                     popchain::schema::price_t price);

/// Decode raw name, description and url bytes into a tier.
///
/// Name and description must be UTF-8, the url must be ASCII. On failure
/// returns std::nullopt and sets `error` to `encoding_failure`.
std::optional<popchain::schema::tier_t> create_tier_from_bytes(
    const popchain::schema::bytes_view_t& name,
    const popchain::schema::bytes_view_t& description,
    const popchain::schema::bytes_view_t& url,
    popchain::schema::price_t price,
    popchain::schema::failure_t& error);

/// The canonical four tier ladder: PopPass, PopBadge, PopMedal, PopTrophy.
///
/// Index order is part of the contract; callers address tiers by position.
std::array<popchain::schema::tier_t, kDefaultTierCount>
default_popchain_tiers();

/// Zip four parallel sequences into tiers, index by index.
///
/// All four sequences must have the same length. A mismatch is reported as
/// `length_mismatch` before any tier is built.
std::optional<std::vector<popchain::schema::tier_t>> create_custom_tiers(
    const std::vector<std::string>& names,
    const std::vector<std::string>& descriptions,
    const std::vector<popchain::schema::url_t>& urls,
    const std::vector<popchain::schema::price_t>& prices,
    popchain::schema::failure_t& error);

inline popchain::schema::price_t get_tier_price(
    const popchain::schema::tier_t& tier) {
  return tier.price;
}

inline const std::string& get_tier_name(const popchain::schema::tier_t& tier) {
  return tier.name;
}

}  // namespace popchain::catalog
