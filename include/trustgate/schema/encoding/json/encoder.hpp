#pragma once
#include <trustgate/common/critical.hpp>
#include <trustgate/schema/encoding/encoder.hpp>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <exception>
#include <iterator>
#include <string>
#include <utility>

namespace trustgate::schema::encoding {

namespace json {

/// Compact, sorted-key serialization. Object keys are ordered by
/// nlohmann::json's std::map storage, so equal documents always produce
/// identical bytes.
inline std::string canonical(const nlohmann::json& value) {
  return value.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

/// Indented form for export and display. Invalid UTF-8 is replaced the same
/// way as in canonical().
inline std::string pretty(const nlohmann::json& value) {
  return value.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
}

template <typename T>
std::string to_canonical(const T& obj) {
  return canonical(nlohmann::json(obj));
}

}  // namespace json

struct json_encoder_tag {};

template <>
struct encoder<json_encoder_tag> final {
  template <typename T>
  trustgate::schema::bytes_t encode(const T& obj);

  template <typename T>
  T decode(const trustgate::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const trustgate::schema::bytes_view_t& bytes);
};

template <typename T>
trustgate::schema::bytes_t encoder<json_encoder_tag>::encode(const T& obj) {
  return trustgate::schema::make_bytes(json::to_canonical(obj));
}

template <typename T>
T encoder<json_encoder_tag>::decode(
    const trustgate::schema::bytes_view_t& bytes) {
  auto decoded = try_decode<T>(bytes);
  if (!decoded) {
    trustgate::common::critical("failed to decode JSON bytes");
  }
  return std::move(decoded.value());
}

template <typename T>
std::optional<T> encoder<json_encoder_tag>::try_decode(
    const trustgate::schema::bytes_view_t& bytes) {
  try {
    return nlohmann::json::parse(std::begin(bytes), std::end(bytes))
        .template get<T>();
  } catch (const std::exception& ex) {
    spdlog::debug("JSON decode failed: {}", ex.what());
    return std::nullopt;
  }
}

}  // namespace trustgate::schema::encoding
