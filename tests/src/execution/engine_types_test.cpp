#include <gtest/gtest.h>
#include <tally/execution/engine.hpp>
#include <tally/schema/query_error_code.hpp>

TEST(engine_types, defaults_are_stable) {
  auto tx = tally::schema::transaction_result_t{};
  EXPECT_EQ(tx.code, 0u);
  EXPECT_TRUE(tx.data.empty());
  EXPECT_TRUE(tx.events.empty());

  auto block = tally::schema::block_result_t{};
  EXPECT_TRUE(block.tx_results.empty());

  auto commit = tally::schema::commit_result_t{};
  EXPECT_EQ(commit.committed_height, 0);
  EXPECT_EQ(commit.committed_epoch, 0u);

  auto info = tally::schema::app_info_t{};
  EXPECT_EQ(info.data, "tally-ledger");
  EXPECT_EQ(info.version, "0.1.0");
  EXPECT_EQ(info.last_block_height, 0);
}

TEST(engine_types, query_error_codes_are_stable) {
  EXPECT_EQ(static_cast<uint32_t>(tally::schema::query_error_code::invalid_key),
            1u);
  EXPECT_EQ(
      static_cast<uint32_t>(tally::schema::query_error_code::unsupported_path),
      2u);
  EXPECT_EQ(static_cast<uint32_t>(tally::schema::query_error_code::not_found),
            3u);
  EXPECT_EQ(static_cast<uint32_t>(
                tally::schema::query_error_code::projection_overflow),
            4u);
}
