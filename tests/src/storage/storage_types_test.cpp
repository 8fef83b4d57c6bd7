#include <gtest/gtest.h>
#include <popchain/schema/custody_record.hpp>
#include <popchain/schema/encoding/scale/encoder.hpp>
#include <popchain/schema/key/engine_keys.hpp>
#include <popchain/storage/rocksdb/storage.hpp>
#include <popchain/storage/storage.hpp>
#include <popchain/testing/common.hpp>

#include <string>
#include <vector>

namespace {

using encoder_t = popchain::schema::encoding::scale_encoder_t;
using popchain::testing::make_db_path;
using popchain::testing::make_hash;
using popchain::testing::remove_path;

}  // namespace

TEST(storage_types, defaults_are_stable) {
  auto committed = popchain::storage::committed_state{};
  EXPECT_EQ(committed.sequence, 0u);
  EXPECT_EQ(committed.state_root, popchain::schema::make_zero_hash());

  auto entry = popchain::storage::key_value_entry_t{};
  EXPECT_TRUE(entry.first.empty());
  EXPECT_TRUE(entry.second.empty());
}

TEST(storage_types, committed_state_round_trips) {
  auto db = make_db_path("popchain_storage_committed");
  {
    auto storage =
        popchain::storage::make_storage<popchain::storage::rocksdb_storage_tag>(db);
    EXPECT_FALSE(storage.load_committed_state().has_value());

    auto state = popchain::storage::committed_state{.sequence = 42,
                                                    .state_root = make_hash(10)};
    storage.save_committed_state(state);

    auto loaded = storage.load_committed_state();
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->sequence, state.sequence);
    EXPECT_EQ(loaded->state_root, state.state_root);
  }
  remove_path(db);
}

TEST(storage_types, commit_writes_entries_with_checkpoint) {
  auto db = make_db_path("popchain_storage_commit");
  {
    auto encoder = encoder_t{};
    auto storage =
        popchain::storage::make_storage<popchain::storage::rocksdb_storage_tag>(db);
    auto record = popchain::schema::custody_record_t{
        .object_id = make_hash(1), .holder = make_hash(2), .since = 5};
    auto key = popchain::schema::key::make_custody_key(encoder, record.object_id);

    storage.commit({popchain::storage::key_value_entry_t{key, encoder.encode(record)}},
                   popchain::storage::committed_state{.sequence = 1,
                                                      .state_root = make_hash(3)});

    auto loaded = storage.get<popchain::schema::custody_record_t>(
        encoder, popchain::schema::bytes_view_t{key.data(), key.size()});
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->holder, make_hash(2));
    EXPECT_EQ(loaded->since, 5u);
    EXPECT_EQ(storage.load_committed_state()->sequence, 1u);
  }
  remove_path(db);
}

TEST(storage_types, list_by_prefix_stays_inside_keyspace) {
  auto db = make_db_path("popchain_storage_prefix");
  {
    auto encoder = encoder_t{};
    auto storage =
        popchain::storage::make_storage<popchain::storage::rocksdb_storage_tag>(db);
    for (uint8_t seed = 1; seed <= 3; ++seed) {
      auto key = popchain::schema::key::make_custody_key(encoder, make_hash(seed));
      storage.put(encoder, popchain::schema::bytes_view_t{key.data(), key.size()},
                  popchain::schema::custody_record_t{.object_id = make_hash(seed),
                                                     .holder = make_hash(50),
                                                     .since = seed});
    }
    auto account_key =
        popchain::schema::key::make_account_key(encoder, make_hash(60));
    storage.put(encoder,
                popchain::schema::bytes_view_t{account_key.data(),
                                               account_key.size()},
                uint64_t{7});

    auto prefix = popchain::schema::key::make_prefix_key(
        encoder, popchain::schema::key::kCustodyKeyPrefix);
    auto rows = storage.list_by_prefix(
        popchain::schema::bytes_view_t{prefix.data(), prefix.size()});
    EXPECT_EQ(rows.size(), 3u);

    auto missing_key =
        popchain::schema::key::make_custody_key(encoder, make_hash(99));
    EXPECT_FALSE(storage
                     .get<popchain::schema::custody_record_t>(
                         encoder, popchain::schema::bytes_view_t{
                                      missing_key.data(), missing_key.size()})
                     .has_value());
  }
  remove_path(db);
}
