#include <tally/common/critical.hpp>
#include <tally/storage/rocksdb/storage.hpp>

namespace tally::storage {

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path) {
  auto store = storage<rocksdb_storage_tag>();

  auto options = ROCKSDB_NAMESPACE::Options{};
  options.create_if_missing = true;
  options.IncreaseParallelism();
  options.OptimizeLevelStyleCompaction();

  ROCKSDB_NAMESPACE::DB* database{nullptr};
  auto status =
      ROCKSDB_NAMESPACE::DB::Open(options, std::string{path}, &database);
  if (!status.ok()) {
    spdlog::error("Failed to open RocksDB at {}: {}", path, status.ToString());
    tally::common::critical("Failed to open RocksDB");
  }
  spdlog::info("Successfully opened RocksDB at {}", path);
  store.database.reset(database);

  return store;
}

std::optional<tally::schema::bytes_t> storage<rocksdb_storage_tag>::get_raw(
    const tally::schema::bytes_view_t& key) const {
  if (!database) {
    tally::common::critical("RocksDB database is not initialized");
  }
  auto value = std::string{};
  auto status = database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                              detail::to_slice(key), &value);
  if (status.IsNotFound()) {
    return std::nullopt;
  }
  if (!status.ok()) {
    spdlog::error("Failed to get value from RocksDB: {}", status.ToString());
    tally::common::critical("Failed to get value from RocksDB");
  }
  return tally::schema::bytes_t(std::begin(value), std::end(value));
}

std::optional<committed_state>
storage<rocksdb_storage_tag>::load_committed_state() const {
  auto raw = get_raw(tally::schema::make_bytes_view(detail::kCommittedStateKey));
  if (!raw) {
    return std::nullopt;
  }

  auto encoder = detail::encoder_t{};
  auto decoded = encoder.try_decode<
      std::tuple<int64_t, tally::schema::epoch_t, tally::schema::hash32_t>>(
      tally::schema::bytes_view_t{raw->data(), raw->size()});
  if (!decoded.has_value()) {
    tally::common::critical("failed to decode committed state");
  }
  return committed_state{.height = std::get<0>(decoded.value()),
                         .epoch = std::get<1>(decoded.value()),
                         .state_root = std::get<2>(decoded.value())};
}

void storage<rocksdb_storage_tag>::commit(
    const std::vector<write_entry_t>& entries,
    const committed_state& state) const {
  if (!database) {
    tally::common::critical("RocksDB database is not initialized");
  }

  auto batch = ROCKSDB_NAMESPACE::WriteBatch{};
  for (const auto& [key, value] : entries) {
    auto key_slice =
        detail::to_slice(tally::schema::bytes_view_t{key.data(), key.size()});
    auto status =
        value.has_value()
            ? batch.Put(key_slice,
                        detail::to_slice(tally::schema::bytes_view_t{
                            value->data(), value->size()}))
            : batch.Delete(key_slice);
    if (!status.ok()) {
      tally::common::critical("failed staging key in commit batch");
    }
  }

  auto encoder = detail::encoder_t{};
  auto encoded =
      encoder.encode(std::tuple{state.height, state.epoch, state.state_root});
  auto state_status = batch.Put(
      ROCKSDB_NAMESPACE::Slice{detail::kCommittedStateKey.data(),
                               detail::kCommittedStateKey.size()},
      detail::to_slice(
          tally::schema::bytes_view_t{encoded.data(), encoded.size()}));
  if (!state_status.ok()) {
    tally::common::critical("failed staging committed state");
  }

  auto write_options = ROCKSDB_NAMESPACE::WriteOptions{};
  write_options.sync = true;
  auto write_status = database->Write(write_options, &batch);
  if (!write_status.ok()) {
    spdlog::error("Failed to commit batch of {} entries: {}", entries.size(),
                  write_status.ToString());
    tally::common::critical("failed to commit write batch");
  }
}

std::vector<key_value_entry_t> storage<rocksdb_storage_tag>::list_by_prefix(
    const tally::schema::bytes_view_t& prefix) const {
  if (!database) {
    tally::common::critical("RocksDB database is not initialized");
  }

  auto entries = std::vector<key_value_entry_t>{};
  auto prefix_string =
      std::string{reinterpret_cast<const char*>(prefix.data()), prefix.size()};

  auto read_options = ROCKSDB_NAMESPACE::ReadOptions{};
  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database->NewIterator(read_options)};
  iterator->Seek(prefix_string);
  while (iterator->Valid()) {
    auto key_view =
        std::string_view{iterator->key().data(), iterator->key().size()};
    if (!key_view.starts_with(prefix_string)) {
      break;
    }
    entries.push_back(key_value_entry_t{detail::to_bytes(iterator->key()),
                                        detail::to_bytes(iterator->value())});
    iterator->Next();
  }
  return entries;
}

}  // namespace tally::storage
