#pragma once
#include <trustgate/schema/primitives.hpp>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace trustgate::storage {

using key_value_entry_t =
    std::pair<trustgate::schema::bytes_t, trustgate::schema::bytes_t>;

/// Key-value backend holding the CA registry and the audit chain. Keys are
/// `|`-separated ASCII prefixes followed by a record id; values are encoded
/// by the caller's encoder.
template <typename Library>
struct storage {
  /// std::nullopt when `key` is absent.
  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const trustgate::schema::bytes_view_t& key) const;

  template <typename T, typename Encoder>
  void put(Encoder& encoder,
           const trustgate::schema::bytes_view_t& key,
           const T& value) const;

  bool contains(const trustgate::schema::bytes_view_t& key) const;

  /// Raw entries under `prefix`, in key order.
  std::vector<key_value_entry_t> list_by_prefix(
      const trustgate::schema::bytes_view_t& prefix) const;

  /// Deletes everything under `prefix` and writes `entries` in one batch.
  void replace_by_prefix(const trustgate::schema::bytes_view_t& prefix,
                         const std::vector<key_value_entry_t>& entries) const;
};

/// Opens (creating when missing) the backend at `path`.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace trustgate::storage
