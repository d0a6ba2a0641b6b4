#pragma once
#include <trustgate/common/critical.hpp>
#include <trustgate/schema/encoding/encoder.hpp>

#include <scale/scale.hpp>
#include <spdlog/spdlog.h>

#include <utility>

namespace trustgate::schema::encoding {

struct scale_encoder_tag {};

/// SCALE codec for the tuples persisted in RocksDB.
template <>
struct encoder<scale_encoder_tag> final {
  template <typename T>
  trustgate::schema::bytes_t encode(const T& obj);

  template <typename T>
  T decode(const trustgate::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const trustgate::schema::bytes_view_t& bytes);
};

template <typename T>
trustgate::schema::bytes_t encoder<scale_encoder_tag>::encode(const T& obj) {
  auto encoded = ::scale::impl::memory::encode(obj);
  if (!encoded) {
    spdlog::error("SCALE encode failed: {}", encoded.error().message());
    trustgate::common::critical("failed to encode storage record");
  }
  return std::move(encoded.value());
}

template <typename T>
T encoder<scale_encoder_tag>::decode(
    const trustgate::schema::bytes_view_t& bytes) {
  auto decoded = try_decode<T>(bytes);
  if (!decoded) {
    spdlog::error("undecodable storage record of {} bytes", bytes.size());
    trustgate::common::critical("failed to decode storage record");
  }
  return std::move(decoded.value());
}

template <typename T>
std::optional<T> encoder<scale_encoder_tag>::try_decode(
    const trustgate::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    spdlog::debug("SCALE decode failed: {}", decoded.error().message());
    return std::nullopt;
  }
  return std::move(decoded.value());
}

}  // namespace trustgate::schema::encoding
