#pragma once

#include <trustgate/common/clock.hpp>
#include <trustgate/crypto/signing_capability.hpp>
#include <trustgate/ledger/ledger_capability.hpp>
#include <trustgate/schema/audit_entry.hpp>
#include <trustgate/storage/rocksdb/storage.hpp>

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace trustgate::audit {

inline const auto kAuditProtocol =
    trustgate::crypto::protocol_id_t{0, "agidentity-audit"};
inline constexpr auto kAuditAnchorType =
    std::string_view{"trustgate-audit-anchor"};

/// `audit-<entry id>`
std::string audit_key_id(const std::string& entry_id);

/// Hash of the full canonical entry, signature included. The next entry
/// links to this value.
trustgate::schema::hash_hex_t hash_entry(
    const trustgate::schema::audit_entry_t& entry);

struct signed_audit_trail_options final {
  bool anchor_to_ledger{false};
  uint64_t anchor_interval_entries{100};
  std::chrono::milliseconds signing_timeout{5000};
  std::chrono::milliseconds ledger_timeout{5000};
};

/// Append-only, signed, hash-chained log of agent actions.
///
/// Every entry is signed over its canonical JSON, previous hash included,
/// with counterparty `anyone`, so any holder of the trail's public key can
/// verify the whole prefix. Raw keys, inputs and outputs are stored only as
/// hashes.
///
/// Entries since the last anchor form the pending range. Anchoring commits
/// their Merkle root through the ledger; a failed publish leaves the range
/// pending for the next attempt and never touches appended entries.
class signed_audit_trail final {
 public:
  /// With a store attached the persisted chain is reloaded and re-verified.
  /// A store that fails verification is fatal.
  signed_audit_trail(
      std::shared_ptr<trustgate::crypto::signing_capability> signer,
      signed_audit_trail_options options = {},
      trustgate::common::clock_fn_t clock = trustgate::common::system_clock(),
      std::shared_ptr<trustgate::ledger::ledger_capability> ledger = nullptr,
      const trustgate::storage::rocksdb_storage_t* store = nullptr);

  signed_audit_trail(const signed_audit_trail&) = delete;
  signed_audit_trail& operator=(const signed_audit_trail&) = delete;

  trustgate::schema::audit_entry_result_t create_entry(
      const trustgate::schema::audit_entry_request_t& request);

  trustgate::schema::entry_verification_result_t verify_entry(
      const trustgate::schema::audit_entry_t& entry) const;

  trustgate::schema::chain_verification_result_t verify_chain() const;

  /// Linkage and signatures of an arbitrary entry sequence starting from the
  /// zero hash. A linkage mismatch right after an entry that already failed
  /// its signature check is attributed to that entry and not repeated.
  trustgate::schema::chain_verification_result_t verify_entries(
      const std::vector<trustgate::schema::audit_entry_t>& entries) const;

  /// Commits the pending range. std::nullopt when nothing is pending, no
  /// ledger is attached, another anchoring is in flight or the publish
  /// failed.
  std::optional<trustgate::schema::blockchain_anchor_t> anchor_to_blockchain();
  uint64_t pending_entries() const;

  trustgate::schema::audit_chain_t chain() const;
  std::size_t size() const;
  trustgate::schema::hash_hex_t head_hash() const;

  std::vector<trustgate::schema::audit_entry_t> entries_for_user(
      const trustgate::schema::public_key_t& user_public_key) const;
  std::vector<trustgate::schema::audit_entry_t> entries_by_action(
      const std::string& action) const;
  std::vector<trustgate::schema::audit_entry_t> entries_in_range(
      trustgate::schema::timestamp_milliseconds_t start,
      trustgate::schema::timestamp_milliseconds_t end) const;

  std::string export_to_json() const;

  /// Replaces the chain with `json` only when every entry, the head hash and
  /// every anchor verify. On any violation nothing changes.
  trustgate::schema::chain_verification_result_t import_from_json(
      const std::string& json);

  const trustgate::schema::public_key_t& public_key() const;

 private:
  trustgate::schema::chain_verification_result_t verify_imported(
      const trustgate::schema::audit_chain_t& chain,
      uint64_t& anchored_entries) const;
  void reload();

  std::shared_ptr<trustgate::crypto::signing_capability> signer_;
  std::shared_ptr<trustgate::ledger::ledger_capability> ledger_;
  const trustgate::storage::rocksdb_storage_t* store_;
  signed_audit_trail_options options_;
  trustgate::common::clock_fn_t clock_;
  trustgate::schema::public_key_t public_key_;

  // Serializes appends and imports. Taken before state_mutex_.
  std::mutex append_mutex_;
  std::mutex anchor_mutex_;
  mutable std::mutex state_mutex_;
  std::vector<trustgate::schema::audit_entry_t> entries_;
  std::vector<trustgate::schema::hash_hex_t> entry_hashes_;
  trustgate::schema::hash_hex_t head_hash_;
  std::vector<trustgate::schema::blockchain_anchor_t> anchors_;
  uint64_t anchored_entries_{};
};

}  // namespace trustgate::audit
