#pragma once

#include <tally/schema/primitives.hpp>
#include <tally/storage/storage.hpp>
#include <functional>
#include <map>
#include <optional>
#include <vector>

namespace tally::execution {

/// Staged key/value mutations layered over a read source.
///
/// Reads see this layer's writes first and fall through to `parent` for
/// anything untouched. A staged deletion hides the parent's value.
/// `merge_into` folds the layer into an enclosing overlay, which is how a
/// transaction's writes become part of the block only after it succeeds.
class write_overlay final {
 public:
  using reader_t = std::function<std::optional<tally::schema::bytes_t>(
      const tally::schema::bytes_view_t&)>;

  explicit write_overlay(reader_t parent);

  std::optional<tally::schema::bytes_t> get(
      const tally::schema::bytes_view_t& key) const;
  void put(tally::schema::bytes_t key, tally::schema::bytes_t value);
  void erase(tally::schema::bytes_t key);

  void merge_into(write_overlay& target) const;
  std::vector<tally::storage::write_entry_t> entries() const;
  bool empty() const;
  void clear();

 private:
  reader_t parent_;
  std::map<tally::schema::bytes_t, std::optional<tally::schema::bytes_t>>
      writes_;
};

}  // namespace tally::execution
