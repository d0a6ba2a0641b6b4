#include <trustgate/schema/primitives.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <charconv>
#include <tuple>
#include <iterator>

namespace trustgate::schema {

namespace {

template <typename Range>
bytes_t copy_bytes(const Range& range) {
  auto out = bytes_t{};
  out.reserve(std::size(range));
  std::transform(std::begin(range), std::end(range), std::back_inserter(out),
                 [](const auto c) { return static_cast<uint8_t>(c); });
  return out;
}

const char* as_chars(const bytes_view_t& bytes) {
  return reinterpret_cast<const char*>(bytes.data());
}

}  // namespace

bytes_t make_bytes(const bytes_view_t& bytes) {
  return copy_bytes(bytes);
}

bytes_t make_bytes(const std::string& bytes) {
  return copy_bytes(bytes);
}

bytes_t make_bytes(const std::string_view& bytes) {
  return copy_bytes(bytes);
}

bytes_view_t make_bytes_view(const bytes_t& bytes) {
  return {bytes.data(), bytes.size()};
}

bytes_view_t make_bytes_view(const std::string& bytes) {
  return make_bytes_view(std::string_view{bytes});
}

bytes_view_t make_bytes_view(const std::string_view& bytes) {
  return {reinterpret_cast<const uint8_t*>(bytes.data()), bytes.size()};
}

std::string_view make_string_view(const bytes_t& bytes) {
  return {as_chars(make_bytes_view(bytes)), bytes.size()};
}

std::string make_string(const bytes_t& bytes) {
  return std::string{make_string_view(bytes)};
}

std::string make_string(const bytes_view_t& bytes) {
  return {as_chars(bytes), bytes.size()};
}

std::string to_hex(const bytes_view_t& bytes) {
  auto out = std::string{};
  out.reserve(bytes.size() * 2);
  for (const auto byte : bytes) {
    fmt::format_to(std::back_inserter(out), "{:02x}", byte);
  }
  return out;
}

std::string to_hex(const hash32_t& hash) {
  return to_hex(bytes_view_t{hash});
}

std::optional<bytes_t> try_from_hex(std::string_view hex) {
  if (hex.starts_with("0x") || hex.starts_with("0X")) {
    hex.remove_prefix(2);
  }
  if (hex.size() % 2 != 0) {
    return std::nullopt;
  }

  auto out = bytes_t(hex.size() / 2);
  for (auto i = std::size_t{}; i < out.size(); ++i) {
    const auto* first = hex.data() + (2 * i);
    auto [end, error] = std::from_chars(first, first + 2, out[i], 16);
    if (error != std::errc{} || end != first + 2) {
      return std::nullopt;
    }
  }
  return out;
}

std::optional<hash32_t> try_make_hash32(const std::string_view hex) {
  auto bytes = try_from_hex(hex);
  if (!bytes || bytes->size() != std::tuple_size_v<hash32_t>) {
    return std::nullopt;
  }
  auto hash = hash32_t{};
  std::copy_n(std::begin(*bytes), hash.size(), std::begin(hash));
  return hash;
}

hash_hex_t make_zero_hash_hex() {
  return hash_hex_t(2 * std::tuple_size_v<hash32_t>, '0');
}

}  // namespace trustgate::schema
