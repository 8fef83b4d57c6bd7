#include <popchain/catalog/tier_catalog.hpp>

#include <spdlog/spdlog.h>
#include <utility>

using namespace popchain::schema;

namespace popchain::catalog {

tier_t create_tier(std::string name,
                   std::string description,
                   url_t url,
                   price_t price) {
  return tier_t{.name = std::move(name),
                .description = std::move(description),
                .url = std::move(url),
                .price = price};
}

std::optional<tier_t> create_tier_from_bytes(const bytes_view_t& name,
                                             const bytes_view_t& description,
                                             const bytes_view_t& url,
                                             price_t price,
                                             failure_t& error) {
  if (!is_utf8(name)) {
    error = failure_t{.code = transaction_error_code::encoding_failure,
                    .message = "tier name is not valid UTF-8"};
    return std::nullopt;
  }
  if (!is_utf8(description)) {
    error = failure_t{.code = transaction_error_code::encoding_failure,
                    .message = "tier description is not valid UTF-8"};
    return std::nullopt;
  }
  if (!is_ascii(url)) {
    error = failure_t{.code = transaction_error_code::encoding_failure,
                    .message = "tier url is not ASCII"};
    return std::nullopt;
  }
  return create_tier(make_string(name), make_string(description),
                     url_t{make_string(url)}, price);
}

std::array<tier_t, kDefaultTierCount> default_popchain_tiers() {
  return {
      create_tier("PopPass", "Entry level proof of attendance",
                  url_t{"https://assets.popchain.app/tiers/poppass.png"},
                  10'000'000),
      create_tier("PopBadge", "Recognises an engaged participant",
                  url_t{"https://assets.popchain.app/tiers/popbadge.png"},
                  30'000'000),
      create_tier("PopMedal", "Awarded for outstanding participation",
                  url_t{"https://assets.popchain.app/tiers/popmedal.png"},
                  50'000'000),
      create_tier("PopTrophy", "Top honour for an event",
                  url_t{"https://assets.popchain.app/tiers/poptrophy.png"},
                  70'000'000)};
}

std::optional<std::vector<tier_t>> create_custom_tiers(
    const std::vector<std::string>& names,
    const std::vector<std::string>& descriptions,
    const std::vector<url_t>& urls,
    const std::vector<price_t>& prices,
    failure_t& error) {
  auto count = names.size();
  if (descriptions.size() != count || urls.size() != count ||
      prices.size() != count) {
    spdlog::warn(
        "Rejecting custom tiers: names={}, descriptions={}, urls={}, "
        "prices={}",
        names.size(), descriptions.size(), urls.size(), prices.size());
    error = failure_t{
        .code = transaction_error_code::length_mismatch,
        .message = "names, descriptions, urls and prices differ in length"};
    return std::nullopt;
  }

  auto tiers = std::vector<tier_t>{};
  tiers.reserve(count);
  for (std::size_t i = 0; i < count; ++i) {
    tiers.push_back(create_tier(names[i], descriptions[i], urls[i], prices[i]));
  }
  return tiers;
}

}  // namespace popchain::catalog
