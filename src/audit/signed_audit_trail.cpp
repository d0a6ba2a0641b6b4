#include <trustgate/audit/merkle.hpp>
#include <trustgate/audit/signed_audit_trail.hpp>
#include <trustgate/blake3/hash.hpp>
#include <trustgate/common/critical.hpp>
#include <trustgate/common/deadline.hpp>
#include <trustgate/common/format.hpp>
#include <trustgate/schema/encoding/json/audit_entry.hpp>
#include <trustgate/schema/encoding/json/encoder.hpp>
#include <trustgate/storage/records.hpp>

#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>
#include <iterator>
#include <utility>

using namespace trustgate::schema;

namespace trustgate::audit {

namespace {

hash_hex_t hash_optional(const std::optional<std::string>& value) {
  if (!value || value->empty()) {
    return {};
  }
  return trustgate::blake3::hash_hex(value.value());
}

audit_violation_t violation(std::string entry_id,
                            const trust_error_code code,
                            std::string message) {
  return audit_violation_t{std::move(entry_id), code, std::move(message)};
}

}  // namespace

std::string audit_key_id(const std::string& entry_id) {
  return fmt::format("audit-{}", entry_id);
}

hash_hex_t hash_entry(const audit_entry_t& entry) {
  return trustgate::blake3::hash_hex(
      trustgate::schema::encoding::json::to_canonical(entry));
}

signed_audit_trail::signed_audit_trail(
    std::shared_ptr<trustgate::crypto::signing_capability> signer,
    signed_audit_trail_options options,
    trustgate::common::clock_fn_t clock,
    std::shared_ptr<trustgate::ledger::ledger_capability> ledger,
    const trustgate::storage::rocksdb_storage_t* store)
    : signer_{std::move(signer)},
      ledger_{std::move(ledger)},
      store_{store},
      options_{options},
      clock_{std::move(clock)},
      head_hash_{make_zero_hash_hex()} {
  if (!signer_) {
    trustgate::common::critical("audit trail requires a signer");
  }
  if (options_.anchor_interval_entries == 0) {
    options_.anchor_interval_entries = 1;
  }
  public_key_ = signer_->public_key();
  if (store_ != nullptr) {
    reload();
  }
}

void signed_audit_trail::reload() {
  auto stored = trustgate::storage::load_audit_chain(*store_);
  auto chain = audit_chain_t{};
  chain.entries.reserve(stored.entries.size());
  for (const auto& json : stored.entries) {
    try {
      chain.entries.push_back(nlohmann::json::parse(json).get<audit_entry_t>());
    } catch (const std::exception& ex) {
      spdlog::error("unreadable audit entry in store: {}", ex.what());
      trustgate::common::critical("audit store holds a malformed entry");
    }
  }
  chain.head_hash = chain.entries.empty() ? make_zero_hash_hex()
                                          : hash_entry(chain.entries.back());
  chain.blockchain_anchors = std::move(stored.anchors);

  auto anchored = uint64_t{};
  auto verification = verify_imported(chain, anchored);
  if (!verification.valid) {
    for (const auto& error : verification.errors) {
      spdlog::error("stored audit entry {}: {}", error.entry_id, error.message);
    }
    trustgate::common::critical("audit store failed verification");
  }
  if (anchored != stored.anchored_entries) {
    spdlog::warn("stored anchor coverage {} differs from recomputed {}",
                 stored.anchored_entries, anchored);
  }

  entry_hashes_.reserve(chain.entries.size());
  for (const auto& entry : chain.entries) {
    entry_hashes_.push_back(hash_entry(entry));
  }
  entries_ = std::move(chain.entries);
  head_hash_ = std::move(chain.head_hash);
  anchors_ = std::move(chain.blockchain_anchors);
  anchored_entries_ = anchored;
  spdlog::info("audit trail reloaded: {} entries, {} anchors",
               entries_.size(), anchors_.size());
}

audit_entry_result_t signed_audit_trail::create_entry(
    const audit_entry_request_t& request) {
  auto result = audit_entry_result_t{};
  auto pending = uint64_t{};
  {
    auto append = std::scoped_lock{append_mutex_};
    auto index = std::size_t{};
    auto entry = audit_entry_t{};
    {
      auto lock = std::scoped_lock{state_mutex_};
      index = entries_.size();
      entry.previous_entry_hash = head_hash_;
    }

    entry.timestamp = clock_();
    entry.entry_id = fmt::format("audit-{}-{}", entry.timestamp, index);
    entry.action = request.action;
    entry.user_public_key_hash =
        trustgate::blake3::hash_hex(request.user_public_key);
    entry.agent_public_key = request.agent_public_key;
    entry.input_hash = hash_optional(request.input);
    entry.output_hash = hash_optional(request.output);
    if (request.metadata && !request.metadata->is_null()) {
      entry.metadata = request.metadata;
    }

    auto signature = trustgate::common::call_with_deadline(
        "audit entry signing",
        trustgate::common::deadline_for(*signer_, options_.signing_timeout),
        [signer = signer_,
         payload = trustgate::schema::encoding::json::audit_signing_payload(
             entry),
         key_id = audit_key_id(entry.entry_id)] {
          return signer->sign(make_bytes_view(payload), kAuditProtocol, key_id,
                              trustgate::crypto::counterparty_anyone{});
        });
    if (!signature) {
      spdlog::error("audit entry for action {} not recorded: signing failed",
                    request.action);
      result.error = trust_error_code::signing_unavailable;
      result.message = "Audit entry signing failed";
      return result;
    }
    entry.signature = to_hex(make_bytes_view(signature.value()));

    auto json = trustgate::schema::encoding::json::to_canonical(entry);
    auto hash = trustgate::blake3::hash_hex(json);
    if (store_ != nullptr) {
      trustgate::storage::save_audit_entry(*store_, index, json);
    }
    {
      auto lock = std::scoped_lock{state_mutex_};
      entries_.push_back(entry);
      entry_hashes_.push_back(hash);
      head_hash_ = std::move(hash);
      pending = entries_.size() - anchored_entries_;
    }
    spdlog::debug("audit entry {} appended for action {}", entry.entry_id,
                  entry.action);
    result.entry = std::move(entry);
  }

  if (options_.anchor_to_ledger &&
      pending >= options_.anchor_interval_entries) {
    anchor_to_blockchain();
  }
  return result;
}

entry_verification_result_t signed_audit_trail::verify_entry(
    const audit_entry_t& entry) const {
  auto result = entry_verification_result_t{};
  auto signature = try_from_hex(entry.signature);
  if (!signature || signature->empty()) {
    result.errors.push_back(violation(entry.entry_id,
                                      trust_error_code::invalid_signature,
                                      "Invalid signature"));
    return result;
  }

  auto verified = trustgate::common::call_with_deadline(
      "audit signature verification",
      trustgate::common::deadline_for(*signer_, options_.signing_timeout),
      [signer = signer_,
       payload =
           trustgate::schema::encoding::json::audit_signing_payload(entry),
       signature = std::move(signature.value()),
       key_id = audit_key_id(entry.entry_id), public_key = public_key_] {
        return signer->verify(make_bytes_view(payload),
                              make_bytes_view(signature), kAuditProtocol,
                              key_id,
                              trustgate::crypto::counterparty_anyone{
                                  public_key});
      });
  if (!verified.has_value()) {
    result.errors.push_back(violation(entry.entry_id,
                                      trust_error_code::signing_unavailable,
                                      "Signature verification unavailable"));
  } else if (!verified.value()) {
    result.errors.push_back(violation(entry.entry_id,
                                      trust_error_code::invalid_signature,
                                      "Invalid signature"));
  }
  result.valid = result.errors.empty();
  return result;
}

chain_verification_result_t signed_audit_trail::verify_entries(
    const std::vector<audit_entry_t>& entries) const {
  auto result = chain_verification_result_t{};
  auto previous = make_zero_hash_hex();
  auto previous_tampered = false;
  for (const auto& entry : entries) {
    if (entry.previous_entry_hash != previous && !previous_tampered) {
      result.errors.push_back(
          violation(entry.entry_id, trust_error_code::chain_linkage_broken,
                    "Chain linkage broken - previous hash mismatch"));
    }

    auto verification = verify_entry(entry);
    previous_tampered = false;
    for (auto& error : verification.errors) {
      previous_tampered |= error.code == trust_error_code::invalid_signature;
      result.errors.push_back(std::move(error));
    }
    previous = hash_entry(entry);
  }
  result.entries_verified = entries.size();
  result.valid = result.errors.empty();
  return result;
}

chain_verification_result_t signed_audit_trail::verify_chain() const {
  auto result = verify_entries(chain().entries);
  for (const auto& error : result.errors) {
    spdlog::error("audit chain violation at {}: {}", error.entry_id,
                  error.message);
  }
  return result;
}

chain_verification_result_t signed_audit_trail::verify_imported(
    const audit_chain_t& chain,
    uint64_t& anchored_entries) const {
  auto result = verify_entries(chain.entries);

  auto expected_head = chain.entries.empty() ? make_zero_hash_hex()
                                             : hash_entry(chain.entries.back());
  if (chain.head_hash != expected_head) {
    result.errors.push_back(violation(
        chain.entries.empty() ? std::string{} : chain.entries.back().entry_id,
        trust_error_code::chain_import_invalid,
        "Head hash does not match the last entry"));
  }

  auto position = std::size_t{};
  for (const auto& anchor : chain.blockchain_anchors) {
    for (const auto& hash : anchor.entry_hashes) {
      if (position >= chain.entries.size() ||
          hash_entry(chain.entries[position]) != hash) {
        result.errors.push_back(violation(
            {}, trust_error_code::chain_import_invalid,
            fmt::format("Anchor {} does not cover a contiguous range of the "
                        "chain",
                        anchor.tx_id)));
        result.valid = false;
        anchored_entries = position;
        return result;
      }
      ++position;
    }
  }
  anchored_entries = position;
  result.valid = result.errors.empty();
  return result;
}

std::optional<blockchain_anchor_t>
signed_audit_trail::anchor_to_blockchain() {
  auto anchoring = std::unique_lock{anchor_mutex_, std::try_to_lock};
  if (!anchoring.owns_lock()) {
    spdlog::debug("audit anchoring already in progress");
    return std::nullopt;
  }
  if (!ledger_) {
    spdlog::warn("audit anchoring requested without a ledger");
    return std::nullopt;
  }

  auto hashes = std::vector<hash_hex_t>{};
  auto head = hash_hex_t{};
  auto end = uint64_t{};
  {
    auto lock = std::scoped_lock{state_mutex_};
    end = entries_.size();
    hashes.assign(std::next(std::begin(entry_hashes_),
                            static_cast<std::ptrdiff_t>(anchored_entries_)),
                  std::end(entry_hashes_));
    head = head_hash_;
  }
  if (hashes.empty()) {
    return std::nullopt;
  }

  auto timestamp = clock_();
  auto merkle_root = compute_merkle_root(hashes);
  auto commitment = trustgate::schema::encoding::json::canonical(
      nlohmann::json{{"type", std::string{kAuditAnchorType}},
                     {"version", 1},
                     {"merkleRoot", merkle_root},
                     {"entryCount", hashes.size()},
                     {"headHash", head},
                     {"timestamp", timestamp}});
  auto tx_id = trustgate::common::call_with_deadline(
      "audit anchor publish",
      trustgate::common::deadline_for(*ledger_, options_.ledger_timeout),
      [ledger = ledger_, commitment = std::move(commitment)] {
        return ledger->publish(make_bytes_view(commitment));
      });
  if (!tx_id) {
    spdlog::warn("audit anchor publish failed; {} entries remain pending",
                 hashes.size());
    return std::nullopt;
  }

  auto anchor = blockchain_anchor_t{};
  anchor.tx_id = std::move(tx_id.value());
  anchor.timestamp = timestamp;
  anchor.entry_hashes = std::move(hashes);
  auto index = std::size_t{};
  {
    auto lock = std::scoped_lock{state_mutex_};
    anchors_.push_back(anchor);
    anchored_entries_ = end;
    index = anchors_.size() - 1;
  }
  if (store_ != nullptr) {
    trustgate::storage::save_audit_anchor(*store_, index, anchor, end);
  }
  spdlog::info("anchored {} audit entries with root {} in {}",
               anchor.entry_hashes.size(),
               trustgate::common::short_key(merkle_root), anchor.tx_id);
  return anchor;
}

uint64_t signed_audit_trail::pending_entries() const {
  auto lock = std::scoped_lock{state_mutex_};
  return entries_.size() - anchored_entries_;
}

audit_chain_t signed_audit_trail::chain() const {
  auto lock = std::scoped_lock{state_mutex_};
  return audit_chain_t{entries_, head_hash_, anchors_};
}

std::size_t signed_audit_trail::size() const {
  auto lock = std::scoped_lock{state_mutex_};
  return entries_.size();
}

hash_hex_t signed_audit_trail::head_hash() const {
  auto lock = std::scoped_lock{state_mutex_};
  return head_hash_;
}

std::vector<audit_entry_t> signed_audit_trail::entries_for_user(
    const public_key_t& user_public_key) const {
  auto user_hash = trustgate::blake3::hash_hex(user_public_key);
  auto lock = std::scoped_lock{state_mutex_};
  auto out = std::vector<audit_entry_t>{};
  std::copy_if(std::begin(entries_), std::end(entries_),
               std::back_inserter(out), [&](const auto& entry) {
                 return entry.user_public_key_hash == user_hash;
               });
  return out;
}

std::vector<audit_entry_t> signed_audit_trail::entries_by_action(
    const std::string& action) const {
  auto lock = std::scoped_lock{state_mutex_};
  auto out = std::vector<audit_entry_t>{};
  std::copy_if(std::begin(entries_), std::end(entries_),
               std::back_inserter(out),
               [&](const auto& entry) { return entry.action == action; });
  return out;
}

std::vector<audit_entry_t> signed_audit_trail::entries_in_range(
    const timestamp_milliseconds_t start,
    const timestamp_milliseconds_t end) const {
  auto lock = std::scoped_lock{state_mutex_};
  auto out = std::vector<audit_entry_t>{};
  std::copy_if(std::begin(entries_), std::end(entries_),
               std::back_inserter(out), [&](const auto& entry) {
                 return entry.timestamp >= start && entry.timestamp <= end;
               });
  return out;
}

std::string signed_audit_trail::export_to_json() const {
  return trustgate::schema::encoding::json::pretty(nlohmann::json(chain()));
}

chain_verification_result_t signed_audit_trail::import_from_json(
    const std::string& json) {
  auto chain = audit_chain_t{};
  try {
    chain = nlohmann::json::parse(json).get<audit_chain_t>();
  } catch (const std::exception& ex) {
    spdlog::warn("rejected audit import: {}", ex.what());
    auto result = chain_verification_result_t{};
    result.errors.push_back(violation({}, trust_error_code::chain_import_invalid,
                                      fmt::format("Malformed audit chain: {}",
                                                  ex.what())));
    return result;
  }

  auto guard = std::scoped_lock{append_mutex_, anchor_mutex_};
  auto anchored = uint64_t{};
  auto result = verify_imported(chain, anchored);
  if (!result.valid) {
    spdlog::error("rejected audit import with {} violations",
                  result.errors.size());
    return result;
  }

  auto hashes = std::vector<hash_hex_t>{};
  auto stored = trustgate::storage::stored_audit_chain{};
  hashes.reserve(chain.entries.size());
  stored.entries.reserve(chain.entries.size());
  for (const auto& entry : chain.entries) {
    auto canonical = trustgate::schema::encoding::json::to_canonical(entry);
    hashes.push_back(trustgate::blake3::hash_hex(canonical));
    stored.entries.push_back(std::move(canonical));
  }
  stored.anchors = chain.blockchain_anchors;
  stored.anchored_entries = anchored;
  if (store_ != nullptr) {
    trustgate::storage::replace_audit_chain(*store_, stored);
  }

  {
    auto lock = std::scoped_lock{state_mutex_};
    entries_ = std::move(chain.entries);
    entry_hashes_ = std::move(hashes);
    head_hash_ = std::move(chain.head_hash);
    anchors_ = std::move(chain.blockchain_anchors);
    anchored_entries_ = anchored;
  }
  spdlog::info("imported audit chain of {} entries", result.entries_verified);
  return result;
}

const public_key_t& signed_audit_trail::public_key() const {
  return public_key_;
}

}  // namespace trustgate::audit
