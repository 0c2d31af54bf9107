#include <tally/execution/write_overlay.hpp>
#include <utility>

namespace tally::execution {

write_overlay::write_overlay(reader_t parent) : parent_{std::move(parent)} {}

std::optional<tally::schema::bytes_t> write_overlay::get(
    const tally::schema::bytes_view_t& key) const {
  auto it = writes_.find(tally::schema::make_bytes(key));
  if (it != std::end(writes_)) {
    return it->second;
  }
  if (!parent_) {
    return std::nullopt;
  }
  return parent_(key);
}

void write_overlay::put(tally::schema::bytes_t key,
                        tally::schema::bytes_t value) {
  writes_.insert_or_assign(std::move(key), std::move(value));
}

void write_overlay::erase(tally::schema::bytes_t key) {
  writes_.insert_or_assign(std::move(key), std::nullopt);
}

void write_overlay::merge_into(write_overlay& target) const {
  for (const auto& [key, value] : writes_) {
    target.writes_.insert_or_assign(key, value);
  }
}

std::vector<tally::storage::write_entry_t> write_overlay::entries() const {
  return {std::begin(writes_), std::end(writes_)};
}

bool write_overlay::empty() const {
  return writes_.empty();
}

void write_overlay::clear() {
  writes_.clear();
}

}  // namespace tally::execution
