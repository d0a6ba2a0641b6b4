#pragma once

#include <trustgate/common/clock.hpp>
#include <trustgate/ledger/ledger_capability.hpp>
#include <trustgate/schema/anchor_point.hpp>
#include <trustgate/schema/trust_error_code.hpp>

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace trustgate::audit {

inline constexpr auto kSessionAnchorType =
    std::string_view{"trustgate-session-anchor"};

/// Hash of the full canonical anchor record, previous hash included.
trustgate::schema::hash_hex_t hash_anchor(
    const trustgate::schema::anchor_point_t& anchor);

struct anchor_commit_result final {
  std::optional<std::string> tx_id;
  trustgate::schema::hash_hex_t merkle_root;
  bool already_committed{};
  std::optional<trustgate::schema::trust_error_code> error;
  std::string message;
};

using anchor_commit_result_t = anchor_commit_result;

/// Per-session decision log. Each anchor links to the hash of the whole
/// previous record and the session's Merkle root is committed once.
///
/// One owner per session; not synchronized.
class anchor_chain final {
 public:
  anchor_chain(
      std::string session_id,
      trustgate::schema::public_key_t agent_public_key,
      trustgate::common::clock_fn_t clock = trustgate::common::system_clock());

  trustgate::schema::anchor_point_t add_anchor(
      const trustgate::schema::add_anchor_request_t& request);

  trustgate::schema::hash_hex_t merkle_root() const;

  /// Linkage from the zero hash plus the head hash.
  trustgate::schema::anchor_verification_result_t verify() const;

  /// True when the freshly computed root equals `on_chain_root`.
  bool verify_against_on_chain(
      const trustgate::schema::hash_hex_t& on_chain_root) const;

  trustgate::schema::anchor_chain_data_t serialize() const;
  static anchor_chain from_serialized(
      const trustgate::schema::anchor_chain_data_t& data,
      trustgate::common::clock_fn_t clock = trustgate::common::system_clock());

  /// Publishes the session root. Later calls return the first transaction.
  anchor_commit_result_t commit(
      const std::shared_ptr<trustgate::ledger::ledger_capability>& ledger,
      std::chrono::milliseconds timeout);

  const std::vector<trustgate::schema::anchor_point_t>& anchors() const;
  const trustgate::schema::hash_hex_t& head_hash() const;
  const std::string& session_id() const;
  const trustgate::schema::public_key_t& agent_public_key() const;
  std::size_t anchor_count() const;
  const std::optional<std::string>& committed_tx_id() const;

 private:
  std::string session_id_;
  trustgate::schema::public_key_t agent_public_key_;
  trustgate::common::clock_fn_t clock_;
  std::vector<trustgate::schema::anchor_point_t> anchors_;
  trustgate::schema::hash_hex_t head_hash_;
  trustgate::schema::timestamp_milliseconds_t created_at_{};
  std::optional<std::string> committed_tx_id_;
  trustgate::schema::hash_hex_t committed_root_;
};

}  // namespace trustgate::audit
