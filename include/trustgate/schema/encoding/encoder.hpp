#pragma once
#include <trustgate/schema/primitives.hpp>
#include <optional>

namespace trustgate::schema::encoding {

/// Codec selected at build time by tag. Storage records use SCALE; the
/// signed and exported forms use canonical JSON.
///
/// `decode` treats malformed bytes as a fatal fault, `try_decode` reports
/// them as std::nullopt for callers reading untrusted input.
template <typename Library>
struct encoder {
  template <typename T>
  trustgate::schema::bytes_t encode(const T& obj);

  template <typename T>
  T decode(const trustgate::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const trustgate::schema::bytes_view_t& bytes);
};

}  // namespace trustgate::schema::encoding
