#pragma once

#include <trustgate/schema/primitives.hpp>
#include <trustgate/schema/trust_error_code.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// Schema type: audit entry.
// Audit workflow: immutable, signed record of one agent action. Sensitive
// content is stored only as hashes; `previous_entry_hash` links every entry
// to the hash of its predecessor.
namespace trustgate::schema {

template <uint16_t Version>
struct audit_entry;

template <>
struct audit_entry<1> final {
  uint16_t version{1};
  std::string entry_id;
  timestamp_milliseconds_t timestamp{};
  std::string action;
  hash_hex_t user_public_key_hash;
  public_key_t agent_public_key;
  // Empty when the action had no input (or output).
  hash_hex_t input_hash;
  hash_hex_t output_hash;
  hash_hex_t previous_entry_hash;
  std::string signature;
  std::optional<nlohmann::json> metadata;
};

using audit_entry_t = audit_entry<1>;

/// Checkpoint committing a Merkle root over a contiguous range of entry
/// hashes.
template <uint16_t Version>
struct blockchain_anchor;

template <>
struct blockchain_anchor<1> final {
  uint16_t version{1};
  std::string tx_id;
  uint64_t block_height{};
  timestamp_milliseconds_t timestamp{};
  std::vector<hash_hex_t> entry_hashes;
};

using blockchain_anchor_t = blockchain_anchor<1>;

/// Export shape: `{entries, headHash, blockchainAnchors}`.
struct audit_chain final {
  std::vector<audit_entry_t> entries;
  hash_hex_t head_hash;
  std::vector<blockchain_anchor_t> blockchain_anchors;
};

using audit_chain_t = audit_chain;

struct audit_violation final {
  std::string entry_id;
  trust_error_code code{trust_error_code::chain_linkage_broken};
  std::string message;
};

using audit_violation_t = audit_violation;

struct chain_verification_result final {
  bool valid{};
  uint64_t entries_verified{};
  std::vector<audit_violation_t> errors;
};

using chain_verification_result_t = chain_verification_result;

/// Input to `create_entry`. Raw key, input and output are hashed and never
/// stored.
struct audit_entry_request final {
  std::string action;
  public_key_t user_public_key;
  public_key_t agent_public_key;
  std::optional<std::string> input;
  std::optional<std::string> output;
  std::optional<nlohmann::json> metadata;
};

using audit_entry_request_t = audit_entry_request;

struct audit_entry_result final {
  std::optional<audit_entry_t> entry;
  std::optional<trust_error_code> error;
  std::string message;
};

using audit_entry_result_t = audit_entry_result;

struct entry_verification_result final {
  bool valid{};
  std::vector<audit_violation_t> errors;
};

using entry_verification_result_t = entry_verification_result;

}  // namespace trustgate::schema
