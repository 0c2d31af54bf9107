#include <gtest/gtest.h>
#include <tally/execution/write_overlay.hpp>

#include <map>
#include <optional>

namespace {

tally::schema::bytes_t bytes(const std::string_view value) {
  return tally::schema::make_bytes(value);
}

tally::schema::bytes_view_t view(const tally::schema::bytes_t& value) {
  return tally::schema::bytes_view_t{value.data(), value.size()};
}

}  // namespace

TEST(write_overlay, reads_fall_through_to_parent) {
  auto base = std::map<tally::schema::bytes_t, tally::schema::bytes_t>{
      {bytes("a"), bytes("1")}};
  auto overlay = tally::execution::write_overlay{
      [&](const tally::schema::bytes_view_t& key)
          -> std::optional<tally::schema::bytes_t> {
        auto it = base.find(tally::schema::make_bytes(key));
        if (it == std::end(base)) {
          return std::nullopt;
        }
        return it->second;
      }};

  auto key_a = bytes("a");
  auto key_b = bytes("b");
  EXPECT_EQ(overlay.get(view(key_a)), bytes("1"));
  EXPECT_FALSE(overlay.get(view(key_b)).has_value());

  overlay.put(bytes("a"), bytes("2"));
  EXPECT_EQ(overlay.get(view(key_a)), bytes("2"));
  EXPECT_EQ(base.at(key_a), bytes("1"));
}

TEST(write_overlay, erase_hides_parent_value) {
  auto overlay = tally::execution::write_overlay{
      [](const tally::schema::bytes_view_t&) {
        return std::optional<tally::schema::bytes_t>{bytes("parent")};
      }};
  auto key = bytes("k");
  overlay.erase(bytes("k"));
  EXPECT_FALSE(overlay.get(view(key)).has_value());

  auto entries = overlay.entries();
  ASSERT_EQ(entries.size(), 1u);
  EXPECT_EQ(entries.front().first, key);
  EXPECT_FALSE(entries.front().second.has_value());
}

TEST(write_overlay, missing_parent_reads_as_empty) {
  auto overlay =
      tally::execution::write_overlay{tally::execution::write_overlay::reader_t{}};
  auto key = bytes("k");
  EXPECT_FALSE(overlay.get(view(key)).has_value());
  EXPECT_TRUE(overlay.empty());
}

TEST(write_overlay, merge_folds_child_into_parent) {
  auto block =
      tally::execution::write_overlay{tally::execution::write_overlay::reader_t{}};
  block.put(bytes("x"), bytes("block"));

  auto tx = tally::execution::write_overlay{
      [&](const tally::schema::bytes_view_t& key) { return block.get(key); }};
  tx.put(bytes("y"), bytes("tx"));
  tx.erase(bytes("x"));

  auto key_x = bytes("x");
  auto key_y = bytes("y");
  EXPECT_EQ(block.get(view(key_x)), bytes("block"));
  EXPECT_FALSE(block.get(view(key_y)).has_value());

  tx.merge_into(block);
  EXPECT_FALSE(block.get(view(key_x)).has_value());
  EXPECT_EQ(block.get(view(key_y)), bytes("tx"));
}

TEST(write_overlay, discarded_child_leaves_parent_untouched) {
  auto block =
      tally::execution::write_overlay{tally::execution::write_overlay::reader_t{}};
  {
    auto tx = tally::execution::write_overlay{
        [&](const tally::schema::bytes_view_t& key) { return block.get(key); }};
    tx.put(bytes("z"), bytes("aborted"));
  }
  EXPECT_TRUE(block.empty());
  block.put(bytes("z"), bytes("kept"));
  block.clear();
  EXPECT_TRUE(block.empty());
}
