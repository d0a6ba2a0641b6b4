#pragma once
#include <trustgate/schema/primitives.hpp>

#include <cstdint>
#include <memory>
#include <span>
#include <string_view>

namespace trustgate::blake3 {

/// Incremental BLAKE3-256 hasher.
class hasher final {
 public:
  hasher();
  ~hasher();
  hasher(const hasher&) = delete;
  hasher& operator=(const hasher&) = delete;
  hasher(hasher&&) noexcept;
  hasher& operator=(hasher&&) noexcept;

  hasher& update(const std::string_view& str);
  hasher& update(const std::span<const uint8_t>& bytes);
  trustgate::schema::hash32_t finalize() const;

 private:
  struct state;
  std::unique_ptr<state> state_;
};

trustgate::schema::hash32_t hash(const std::string_view& str);
trustgate::schema::hash32_t hash(const std::span<const uint8_t>& bytes);

/// Lowercase hex digest of `str`. Every chain and Merkle hash in trustgate
/// is computed with this function over UTF-8 text.
trustgate::schema::hash_hex_t hash_hex(const std::string_view& str);

}  // namespace trustgate::blake3
