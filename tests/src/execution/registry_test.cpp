#include <gtest/gtest.h>
#include <popchain/catalog/tier_catalog.hpp>
#include <popchain/execution/events.hpp>
#include <popchain/execution/registry.hpp>
#include <popchain/testing/common.hpp>
#include <popchain/testing/fixed_context.hpp>

#include <utility>
#include <vector>

namespace {

using popchain::testing::fixed_context;
using popchain::testing::make_hash;

constexpr popchain::schema::timestamp_milliseconds_t kMintTime{1'700'000'000'000};

popchain::schema::account_state_t make_account(
    const std::optional<popchain::schema::address_t>& owner) {
  return popchain::schema::account_state_t{.account_id = make_hash(40),
                                           .owner = owner};
}

popchain::schema::tier_t badge_tier() {
  return popchain::catalog::default_popchain_tiers()[1];
}

}  // namespace

TEST(registry, popbadge_mint_for_linked_account) {
  auto event_id = make_hash(0xE1);
  auto owner = popchain::schema::make_address("0xABC");
  auto service_wallet = popchain::schema::make_address("0xFEED");
  auto account = make_account(owner);
  auto context = fixed_context{kMintTime};

  auto certificate_id = popchain::execution::mint_certificate(
      event_id, popchain::schema::url_t{"https://meta/1"}, badge_tier(),
      account, service_wallet, context);

  ASSERT_EQ(context.deliveries().size(), 1u);
  const auto& delivery = context.deliveries().front();
  EXPECT_EQ(delivery.recipient, owner);
  EXPECT_EQ(delivery.certificate.id, certificate_id);
  ASSERT_FALSE(account.certificate_ids.empty());
  EXPECT_EQ(account.certificate_ids.back(), certificate_id);

  ASSERT_EQ(context.events().size(), 1u);
  const auto& event = context.events().front();
  EXPECT_EQ(event.type, popchain::execution::kCertificateMintedEvent);
  EXPECT_EQ(popchain::execution::find_attribute(event, "certificate_id"),
            popchain::schema::to_hex(certificate_id));
  EXPECT_EQ(popchain::execution::find_attribute(event, "event_id"),
            popchain::schema::to_hex(event_id));
  EXPECT_EQ(popchain::execution::find_attribute(event, "tier_name"), "PopBadge");
  EXPECT_EQ(popchain::execution::find_attribute(event, "issued_to"),
            popchain::schema::to_hex(owner));
  EXPECT_EQ(popchain::execution::find_attribute(event, "mint_price"),
            "30000000");
}

TEST(registry, certificate_snapshots_tier_and_mint_time) {
  auto account = make_account(make_hash(1));
  auto context = fixed_context{kMintTime};
  auto tier = badge_tier();
  auto expected_url = tier.url;

  popchain::execution::mint_certificate(
      make_hash(2), popchain::schema::url_t{"https://meta/2"}, std::move(tier),
      account, make_hash(3), context);

  const auto& certificate = context.deliveries().front().certificate;
  EXPECT_EQ(popchain::execution::get_tier_name(certificate), "PopBadge");
  EXPECT_EQ(popchain::execution::get_mint_price(certificate), 30'000'000u);
  EXPECT_EQ(popchain::execution::get_tier_url(certificate), expected_url);
  EXPECT_EQ(popchain::execution::get_url(certificate).value, "https://meta/2");
  EXPECT_EQ(popchain::execution::get_event_id(certificate), make_hash(2));
  EXPECT_EQ(popchain::execution::get_issued_at(certificate), kMintTime);

  // Later activity does not reach back into an issued certificate.
  context.set_now(kMintTime + 1'000);
  account.owner = make_hash(9);
  EXPECT_EQ(popchain::execution::get_issued_at(certificate), kMintTime);
  EXPECT_EQ(popchain::execution::get_issued_to(certificate), make_hash(1));
}

TEST(registry, unlinked_account_mints_into_escrow) {
  auto service_wallet = popchain::schema::make_address("0xFEED");
  auto account = make_account(std::nullopt);
  auto context = fixed_context{kMintTime};

  popchain::execution::mint_certificate(
      make_hash(2), popchain::schema::url_t{"https://meta/3"},
      popchain::schema::tier_t{popchain::catalog::default_popchain_tiers()[0]},
      account, service_wallet,
      context);

  ASSERT_EQ(context.deliveries().size(), 1u);
  EXPECT_EQ(context.deliveries().front().recipient, service_wallet);
  EXPECT_FALSE(
      popchain::execution::get_issued_to(context.deliveries().front().certificate)
          .has_value());
  EXPECT_EQ(popchain::execution::find_attribute(context.events().front(),
                                                "issued_to"),
            std::string{popchain::execution::kUnlinkedAddress});
}

TEST(registry, mint_appends_to_account_list_in_order) {
  auto account = make_account(make_hash(1));
  auto earlier = std::vector<popchain::schema::object_id_t>{make_hash(100),
                                                            make_hash(101)};
  account.certificate_ids = earlier;
  auto context = fixed_context{kMintTime};

  auto first = popchain::execution::mint_certificate(
      make_hash(2), popchain::schema::url_t{"https://meta/a"}, badge_tier(),
      account, make_hash(3), context);
  auto second = popchain::execution::mint_certificate(
      make_hash(2), popchain::schema::url_t{"https://meta/b"}, badge_tier(),
      account, make_hash(3), context);

  EXPECT_NE(first, second);
  ASSERT_EQ(account.certificate_ids.size(), 4u);
  EXPECT_EQ(account.certificate_ids[0], earlier[0]);
  EXPECT_EQ(account.certificate_ids[1], earlier[1]);
  EXPECT_EQ(account.certificate_ids[2], first);
  EXPECT_EQ(account.certificate_ids[3], second);
}

TEST(registry, custom_tier_prices_flow_into_certificates) {
  auto error = popchain::schema::failure_t{};
  auto tiers = popchain::catalog::create_custom_tiers(
      {"Crew", "Speaker"}, {"", ""},
      {popchain::schema::url_t{"https://t/crew"},
       popchain::schema::url_t{"https://t/speaker"}},
      {0, 123}, error);
  ASSERT_TRUE(tiers.has_value());

  auto account = make_account(make_hash(1));
  auto context = fixed_context{kMintTime};
  for (auto& tier : *tiers) {
    popchain::execution::mint_certificate(
        make_hash(2), popchain::schema::url_t{""}, std::move(tier), account,
        make_hash(3), context);
  }

  ASSERT_EQ(context.deliveries().size(), 2u);
  EXPECT_EQ(context.deliveries()[0].certificate.tier_name, "Crew");
  EXPECT_EQ(context.deliveries()[0].certificate.mint_price, 0u);
  EXPECT_EQ(context.deliveries()[1].certificate.tier_name, "Speaker");
  EXPECT_EQ(context.deliveries()[1].certificate.mint_price, 123u);
}
