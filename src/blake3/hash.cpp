#include <blake3.h>
#include <trustgate/blake3/hash.hpp>

#include <tuple>

namespace trustgate::blake3 {

struct hasher::state {
  ::blake3_hasher value{};
};

hasher::hasher() : state_{std::make_unique<state>()} {
  blake3_hasher_init(&state_->value);
}

hasher::~hasher() = default;
hasher::hasher(hasher&&) noexcept = default;
hasher& hasher::operator=(hasher&&) noexcept = default;

hasher& hasher::update(const std::string_view& str) {
  blake3_hasher_update(&state_->value, str.data(), str.size());
  return *this;
}

hasher& hasher::update(const std::span<const uint8_t>& bytes) {
  blake3_hasher_update(&state_->value, bytes.data(), bytes.size());
  return *this;
}

trustgate::schema::hash32_t hasher::finalize() const {
  auto output = trustgate::schema::hash32_t{};
  static_assert(BLAKE3_OUT_LEN == std::tuple_size_v<trustgate::schema::hash32_t>);
  blake3_hasher_finalize(&state_->value, output.data(), output.size());
  return output;
}

trustgate::schema::hash32_t hash(const std::string_view& str) {
  return hasher{}.update(str).finalize();
}

trustgate::schema::hash32_t hash(const std::span<const uint8_t>& bytes) {
  return hasher{}.update(bytes).finalize();
}

trustgate::schema::hash_hex_t hash_hex(const std::string_view& str) {
  return trustgate::schema::to_hex(hash(str));
}

}  // namespace trustgate::blake3
