#pragma once
#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace trustgate::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using hash32_t = std::array<uint8_t, 32>;
using timestamp_milliseconds_t = uint64_t;
using duration_milliseconds_t = uint64_t;

// Compressed secp256k1 point, lowercase hex (66 characters).
using public_key_t = std::string;
// Lowercase hex digest (64 characters).
using hash_hex_t = std::string;

bytes_t make_bytes(const bytes_view_t& bytes);
bytes_t make_bytes(const std::string& bytes);
bytes_t make_bytes(const std::string_view& bytes);

bytes_view_t make_bytes_view(const bytes_t& bytes);
bytes_view_t make_bytes_view(const std::string& bytes);
bytes_view_t make_bytes_view(const std::string_view& bytes);

std::string_view make_string_view(const bytes_t& bytes);
std::string make_string(const bytes_t& bytes);
std::string make_string(const bytes_view_t& bytes);

std::string to_hex(const bytes_view_t& bytes);
std::string to_hex(const hash32_t& hash);
std::optional<bytes_t> try_from_hex(std::string_view hex);
std::optional<hash32_t> try_make_hash32(std::string_view hex);

/// 64 zero characters; previous-hash value of the first record in a chain.
hash_hex_t make_zero_hash_hex();

}  // namespace trustgate::schema

template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;
