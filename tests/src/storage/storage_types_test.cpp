#include <gtest/gtest.h>
#include <tally/schema/encoding/scale/encoder.hpp>
#include <tally/schema/key/engine_keys.hpp>
#include <tally/storage/rocksdb/storage.hpp>
#include <tally/storage/storage.hpp>
#include <tally/testing/common.hpp>

#include <optional>
#include <string_view>
#include <vector>

using tally::testing::make_db_path;
using tally::testing::make_hash;
using tally::testing::remove_path;

namespace {

using encoder_t = tally::schema::encoding::encoder<
    tally::schema::encoding::scale_encoder_tag>;

tally::schema::bytes_view_t view(const tally::schema::bytes_t& bytes) {
  return tally::schema::bytes_view_t{bytes.data(), bytes.size()};
}

}  // namespace

TEST(storage_types, defaults_are_stable) {
  auto committed = tally::storage::committed_state{};
  EXPECT_EQ(committed.height, 0);
  EXPECT_EQ(committed.epoch, 0u);

  auto entry = tally::storage::key_value_entry_t{};
  EXPECT_TRUE(entry.first.empty());
  EXPECT_TRUE(entry.second.empty());
}

TEST(storage_types, empty_database_has_no_committed_state) {
  auto db = make_db_path("tally_storage_empty");
  {
    auto storage =
        tally::storage::make_storage<tally::storage::rocksdb_storage_tag>(db);
    EXPECT_FALSE(storage.load_committed_state().has_value());
  }
  remove_path(db);
}

TEST(storage_types, commit_writes_entries_and_checkpoint_together) {
  auto db = make_db_path("tally_storage_commit");
  {
    auto storage =
        tally::storage::make_storage<tally::storage::rocksdb_storage_tag>(db);
    auto encoder = encoder_t{};
    auto keep = tally::schema::make_bytes(std::string_view{"K|keep"});
    auto drop = tally::schema::make_bytes(std::string_view{"K|drop"});
    storage.put(encoder, view(drop), uint64_t{5});

    auto entries = std::vector<tally::storage::write_entry_t>{
        {keep, encoder.encode(uint64_t{7})}, {drop, std::nullopt}};
    storage.commit(entries, tally::storage::committed_state{
                                .height = 42,
                                .epoch = 9,
                                .state_root = make_hash(10)});

    auto loaded = storage.load_committed_state();
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->height, 42);
    EXPECT_EQ(loaded->epoch, 9u);
    EXPECT_EQ(loaded->state_root, make_hash(10));

    auto kept = storage.get<uint64_t>(encoder, view(keep));
    ASSERT_TRUE(kept.has_value());
    EXPECT_EQ(*kept, 7u);
    EXPECT_FALSE(storage.get_raw(view(drop)).has_value());
  }
  remove_path(db);
}

TEST(storage_types, committed_state_survives_reopen) {
  auto db = make_db_path("tally_storage_reopen");
  {
    auto storage =
        tally::storage::make_storage<tally::storage::rocksdb_storage_tag>(db);
    storage.commit({}, tally::storage::committed_state{
                           .height = 3, .epoch = 12, .state_root = make_hash(4)});
  }
  {
    auto storage =
        tally::storage::make_storage<tally::storage::rocksdb_storage_tag>(db);
    auto loaded = storage.load_committed_state();
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->height, 3);
    EXPECT_EQ(loaded->epoch, 12u);
  }
  remove_path(db);
}

TEST(storage_types, list_by_prefix_selects_one_keyspace) {
  auto db = make_db_path("tally_storage_prefix");
  {
    auto storage =
        tally::storage::make_storage<tally::storage::rocksdb_storage_tag>(db);
    auto encoder = encoder_t{};
    auto history = tally::schema::key::make_history_key(encoder, 1, 0);
    auto event = tally::schema::key::make_event_key(encoder, 1);
    auto vault = tally::schema::key::make_vault_key(encoder, make_hash(1));
    storage.put(encoder, view(history), uint64_t{1});
    storage.put(encoder, view(event), uint64_t{2});
    storage.put(encoder, view(vault), uint64_t{3});

    auto prefix = tally::schema::key::make_prefix_key(
        encoder, tally::schema::key::kEventPrefix);
    auto rows = storage.list_by_prefix(view(prefix));
    ASSERT_EQ(rows.size(), 1u);
    EXPECT_EQ(rows[0].first, event);
  }
  remove_path(db);
}

TEST(storage_types, history_and_event_keys_parse_back) {
  auto encoder = encoder_t{};
  auto history = tally::schema::key::make_history_key(encoder, 77, 3);
  auto parsed = tally::schema::key::parse_history_key(encoder, view(history));
  ASSERT_TRUE(parsed.has_value());
  EXPECT_EQ(parsed->first, 77u);
  EXPECT_EQ(parsed->second, 3u);

  auto event = tally::schema::key::make_event_key(encoder, 501);
  auto event_id = tally::schema::key::parse_event_key(encoder, view(event));
  ASSERT_TRUE(event_id.has_value());
  EXPECT_EQ(*event_id, 501u);

  EXPECT_FALSE(
      tally::schema::key::parse_event_key(encoder, view(history)).has_value());
}
