#pragma once

#include <trustgate/schema/enum_string.hpp>
#include <trustgate/schema/primitives.hpp>

#include <nlohmann/json.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// Schema type: anchor point.
// Audit workflow: per-session decision log record. The chain head is the hash
// of the whole previous record, and the session's Merkle root is committed
// once.
namespace trustgate::schema {

enum class anchor_type_t : uint8_t {
  session_start = 0,
  tool_use = 1,
  memory_write = 2,
  payment = 3,
  session_end = 4
};

inline constexpr auto kAnchorTypeNames = enum_names_t<anchor_type_t, 5>{{
     {"session_start", anchor_type_t::session_start},
     {"tool_use", anchor_type_t::tool_use},
     {"memory_write", anchor_type_t::memory_write},
     {"payment", anchor_type_t::payment},
     {"session_end", anchor_type_t::session_end}}};

template <>
inline std::optional<anchor_type_t> try_from_string<anchor_type_t>(
    const std::string_view value) {
  return find_enum(value, kAnchorTypeNames);
}

inline constexpr std::string_view to_string(const anchor_type_t value) {
  return name_of(value, kAnchorTypeNames);
}

template <uint16_t Version>
struct anchor_point;

template <>
struct anchor_point<1> final {
  uint16_t version{1};
  std::string id;
  timestamp_milliseconds_t timestamp{};
  anchor_type_t type{anchor_type_t::session_start};
  hash_hex_t data_hash;
  hash_hex_t previous_hash;
  std::string summary;
  std::optional<nlohmann::json> metadata;
};

using anchor_point_t = anchor_point<1>;

template <uint16_t Version>
struct anchor_chain_data;

template <>
struct anchor_chain_data<1> final {
  uint16_t version{1};
  std::string session_id;
  public_key_t agent_public_key;
  std::vector<anchor_point_t> anchors;
  hash_hex_t head_hash;
  hash_hex_t merkle_root;
  timestamp_milliseconds_t created_at{};
};

using anchor_chain_data_t = anchor_chain_data<1>;

struct add_anchor_request final {
  anchor_type_t type{anchor_type_t::tool_use};
  nlohmann::json data;
  std::string summary;
  std::optional<nlohmann::json> metadata;
};

using add_anchor_request_t = add_anchor_request;

struct anchor_verification_result final {
  bool valid{};
  std::vector<std::string> errors;
};

using anchor_verification_result_t = anchor_verification_result;

}  // namespace trustgate::schema
