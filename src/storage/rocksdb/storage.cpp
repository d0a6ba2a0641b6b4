#include <trustgate/storage/rocksdb/storage.hpp>

namespace trustgate::storage {

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path) {
  auto options = ROCKSDB_NAMESPACE::Options{};
  options.create_if_missing = true;
  options.IncreaseParallelism();
  options.OptimizeLevelStyleCompaction();

  ROCKSDB_NAMESPACE::DB* database{nullptr};
  auto status =
      ROCKSDB_NAMESPACE::DB::Open(options, std::string{path}, &database);
  if (!status.ok()) {
    trustgate::common::critical("cannot open trust store at {}: {}", path,
                                status.ToString());
  }
  spdlog::info("trust store opened at {}", path);

  auto store = storage<rocksdb_storage_tag>{};
  store.database.reset(database);
  return store;
}

ROCKSDB_NAMESPACE::DB& storage<rocksdb_storage_tag>::open_database() const {
  if (!database) {
    trustgate::common::critical("trust store used before it was opened");
  }
  return *database;
}

bool storage<rocksdb_storage_tag>::contains(
    const trustgate::schema::bytes_view_t& key) const {
  auto value = std::string{};
  auto status = open_database().Get(ROCKSDB_NAMESPACE::ReadOptions{},
                                    detail::to_slice(key), &value);
  if (status.IsNotFound()) {
    return false;
  }
  if (!status.ok()) {
    spdlog::error("RocksDB read failed: {}", status.ToString());
    trustgate::common::critical("RocksDB read failed");
  }
  return true;
}

std::vector<key_value_entry_t> storage<rocksdb_storage_tag>::list_by_prefix(
    const trustgate::schema::bytes_view_t& prefix) const {
  auto entries = std::vector<key_value_entry_t>{};
  detail::for_each_prefixed(
      open_database(), prefix,
      [&entries](const ROCKSDB_NAMESPACE::Iterator& it) {
        entries.emplace_back(detail::to_bytes(it.key()),
                             detail::to_bytes(it.value()));
      });
  return entries;
}

void storage<rocksdb_storage_tag>::replace_by_prefix(
    const trustgate::schema::bytes_view_t& prefix,
    const std::vector<key_value_entry_t>& entries) const {
  auto& db = open_database();
  auto batch = ROCKSDB_NAMESPACE::WriteBatch{};
  auto batch_status = ROCKSDB_NAMESPACE::Status::OK();

  detail::for_each_prefixed(
      db, prefix, [&](const ROCKSDB_NAMESPACE::Iterator& it) {
        if (batch_status.ok()) {
          batch_status = batch.Delete(it.key());
        }
      });
  for (const auto& [key, value] : entries) {
    if (!batch_status.ok()) {
      break;
    }
    batch_status =
        batch.Put(detail::to_slice(trustgate::schema::make_bytes_view(key)),
                  detail::to_slice(trustgate::schema::make_bytes_view(value)));
  }
  if (!batch_status.ok()) {
    spdlog::error("building replacement batch failed: {}",
                  batch_status.ToString());
    trustgate::common::critical("failed to build prefix replacement batch");
  }

  auto status = db.Write(ROCKSDB_NAMESPACE::WriteOptions{}, &batch);
  if (!status.ok()) {
    spdlog::error("prefix replacement rejected: {}", status.ToString());
    trustgate::common::critical("failed to commit prefix replacement");
  }
  spdlog::debug("replaced prefix with {} entries", entries.size());
}

}  // namespace trustgate::storage
