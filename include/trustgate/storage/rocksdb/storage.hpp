#pragma once
#include <rocksdb/db.h>
#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <rocksdb/write_batch.h>
#include <spdlog/spdlog.h>
#include <trustgate/common/critical.hpp>
#include <trustgate/schema/encoding/scale/encoder.hpp>
#include <trustgate/storage/storage.hpp>
#include <memory>
#include <string>
#include <string_view>

namespace trustgate::storage {

namespace detail {

inline trustgate::schema::bytes_t to_bytes(
    const ROCKSDB_NAMESPACE::Slice& slice) {
  const auto* begin = reinterpret_cast<const uint8_t*>(slice.data());
  return {begin, begin + slice.size()};
}

inline ROCKSDB_NAMESPACE::Slice to_slice(
    const trustgate::schema::bytes_view_t& bytes) {
  return {reinterpret_cast<const char*>(bytes.data()), bytes.size()};
}

/// Calls `fn(iterator)` for every key starting with `prefix`.
template <typename Fn>
void for_each_prefixed(ROCKSDB_NAMESPACE::DB& database,
                       const trustgate::schema::bytes_view_t& prefix,
                       Fn&& fn) {
  const auto wanted = std::string_view{
      reinterpret_cast<const char*>(prefix.data()), prefix.size()};
  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database.NewIterator(ROCKSDB_NAMESPACE::ReadOptions{})};
  for (iterator->Seek(to_slice(prefix)); iterator->Valid(); iterator->Next()) {
    if (!iterator->key().starts_with(
            ROCKSDB_NAMESPACE::Slice{wanted.data(), wanted.size()})) {
      break;
    }
    fn(*iterator);
  }
  if (!iterator->status().ok()) {
    spdlog::error("RocksDB scan of {} failed: {}", wanted,
                  iterator->status().ToString());
    trustgate::common::critical("RocksDB prefix scan failed");
  }
}

}  // namespace detail

struct rocksdb_storage_tag {};

template <>
struct storage<rocksdb_storage_tag> final {
  std::unique_ptr<ROCKSDB_NAMESPACE::DB> database;

  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const trustgate::schema::bytes_view_t& key) const;

  template <typename T, typename Encoder>
  void put(Encoder& encoder,
           const trustgate::schema::bytes_view_t& key,
           const T& value) const;

  bool contains(const trustgate::schema::bytes_view_t& key) const;

  std::vector<key_value_entry_t> list_by_prefix(
      const trustgate::schema::bytes_view_t& prefix) const;
  void replace_by_prefix(const trustgate::schema::bytes_view_t& prefix,
                         const std::vector<key_value_entry_t>& entries) const;

 private:
  ROCKSDB_NAMESPACE::DB& open_database() const;
};

using rocksdb_storage_t = storage<rocksdb_storage_tag>;

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path);

template <typename T, typename Encoder>
std::optional<T> storage<rocksdb_storage_tag>::get(
    Encoder& encoder,
    const trustgate::schema::bytes_view_t& key) const {
  auto value = std::string{};
  auto status = open_database().Get(ROCKSDB_NAMESPACE::ReadOptions{},
                                    detail::to_slice(key), &value);
  if (status.IsNotFound()) {
    return std::nullopt;
  }
  if (!status.ok()) {
    spdlog::error("RocksDB read failed: {}", status.ToString());
    trustgate::common::critical("RocksDB read failed");
  }
  return encoder.template decode<T>(trustgate::schema::make_bytes_view(value));
}

template <typename T, typename Encoder>
void storage<rocksdb_storage_tag>::put(
    Encoder& encoder,
    const trustgate::schema::bytes_view_t& key,
    const T& value) const {
  auto encoded = encoder.encode(value);
  auto status = open_database().Put(
      ROCKSDB_NAMESPACE::WriteOptions{}, detail::to_slice(key),
      detail::to_slice(trustgate::schema::make_bytes_view(encoded)));
  if (!status.ok()) {
    spdlog::error("RocksDB write failed: {}", status.ToString());
    trustgate::common::critical("RocksDB write failed");
  }
}

}  // namespace trustgate::storage
