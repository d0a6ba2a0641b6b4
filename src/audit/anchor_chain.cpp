#include <trustgate/audit/anchor_chain.hpp>
#include <trustgate/audit/merkle.hpp>
#include <trustgate/blake3/hash.hpp>
#include <trustgate/common/deadline.hpp>
#include <trustgate/common/format.hpp>
#include <trustgate/schema/encoding/json/anchor_point.hpp>
#include <trustgate/schema/encoding/json/encoder.hpp>

#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <utility>

using namespace trustgate::schema;

namespace trustgate::audit {

namespace {

std::string prefix12(const std::string& hash) {
  return hash.substr(0, 12);
}

}  // namespace

hash_hex_t hash_anchor(const anchor_point_t& anchor) {
  return trustgate::blake3::hash_hex(
      trustgate::schema::encoding::json::to_canonical(anchor));
}

anchor_chain::anchor_chain(std::string session_id,
                           public_key_t agent_public_key,
                           trustgate::common::clock_fn_t clock)
    : session_id_{std::move(session_id)},
      agent_public_key_{std::move(agent_public_key)},
      clock_{std::move(clock)},
      head_hash_{make_zero_hash_hex()} {
  created_at_ = clock_();
}

anchor_point_t anchor_chain::add_anchor(const add_anchor_request_t& request) {
  auto anchor = anchor_point_t{};
  anchor.id = fmt::format("anchor-{}", anchors_.size());
  anchor.timestamp = clock_();
  anchor.type = request.type;
  anchor.data_hash = trustgate::blake3::hash_hex(
      trustgate::schema::encoding::json::canonical(request.data));
  anchor.previous_hash = head_hash_;
  anchor.summary = request.summary;
  if (request.metadata && !request.metadata->is_null()) {
    anchor.metadata = request.metadata;
  }

  head_hash_ = hash_anchor(anchor);
  anchors_.push_back(anchor);
  spdlog::debug("session {} anchor {} ({})",
                trustgate::common::short_key(session_id_), anchor.id,
                to_string(anchor.type));
  return anchor;
}

hash_hex_t anchor_chain::merkle_root() const {
  auto hashes = std::vector<hash_hex_t>{};
  hashes.reserve(anchors_.size());
  for (const auto& anchor : anchors_) {
    hashes.push_back(hash_anchor(anchor));
  }
  return compute_merkle_root(std::move(hashes));
}

anchor_verification_result_t anchor_chain::verify() const {
  auto result = anchor_verification_result_t{};
  auto previous = make_zero_hash_hex();
  for (const auto& anchor : anchors_) {
    if (anchor.previous_hash != previous) {
      result.errors.push_back(fmt::format(
          "{}: chain linkage broken (expected {}..., got {}...)", anchor.id,
          prefix12(previous), prefix12(anchor.previous_hash)));
    }
    previous = hash_anchor(anchor);
  }
  if (head_hash_ != previous) {
    result.errors.push_back(
        fmt::format("head hash mismatch (expected {}..., got {}...)",
                    prefix12(previous), prefix12(head_hash_)));
  }
  result.valid = result.errors.empty();
  return result;
}

bool anchor_chain::verify_against_on_chain(
    const hash_hex_t& on_chain_root) const {
  auto computed = merkle_root();
  if (computed != on_chain_root) {
    spdlog::error("session {} root {} differs from published root {}",
                  trustgate::common::short_key(session_id_),
                  trustgate::common::short_key(computed),
                  trustgate::common::short_key(on_chain_root));
    return false;
  }
  return true;
}

anchor_chain_data_t anchor_chain::serialize() const {
  auto data = anchor_chain_data_t{};
  data.session_id = session_id_;
  data.agent_public_key = agent_public_key_;
  data.anchors = anchors_;
  data.head_hash = head_hash_;
  data.merkle_root = merkle_root();
  data.created_at = created_at_;
  return data;
}

anchor_chain anchor_chain::from_serialized(const anchor_chain_data_t& data,
                                           trustgate::common::clock_fn_t clock) {
  auto chain =
      anchor_chain{data.session_id, data.agent_public_key, std::move(clock)};
  chain.anchors_ = data.anchors;
  chain.head_hash_ = data.head_hash;
  chain.created_at_ = data.created_at;
  if (!data.merkle_root.empty() && data.merkle_root != chain.merkle_root()) {
    spdlog::warn("serialized session {} carries a stale merkle root",
                 trustgate::common::short_key(data.session_id));
  }
  return chain;
}

anchor_commit_result_t anchor_chain::commit(
    const std::shared_ptr<trustgate::ledger::ledger_capability>& ledger,
    const std::chrono::milliseconds timeout) {
  auto result = anchor_commit_result_t{};
  if (committed_tx_id_) {
    result.tx_id = committed_tx_id_;
    result.merkle_root = committed_root_;
    result.already_committed = true;
    return result;
  }
  result.merkle_root = merkle_root();
  if (!ledger) {
    result.error = trust_error_code::ledger_unavailable;
    result.message = "No ledger attached";
    return result;
  }

  auto commitment = trustgate::schema::encoding::json::canonical(
      nlohmann::json{{"type", std::string{kSessionAnchorType}},
                     {"version", 1},
                     {"sessionId", session_id_},
                     {"agentPublicKey", agent_public_key_},
                     {"merkleRoot", result.merkle_root},
                     {"anchorCount", anchors_.size()},
                     {"headHash", head_hash_}});
  auto tx_id = trustgate::common::call_with_deadline(
      "session anchor publish",
      trustgate::common::deadline_for(*ledger, timeout),
      [ledger, commitment = std::move(commitment)] {
        return ledger->publish(make_bytes_view(commitment));
      });
  if (!tx_id) {
    spdlog::warn("session {} root not published; retry the commit",
                 trustgate::common::short_key(session_id_));
    result.error = trust_error_code::ledger_unavailable;
    result.message = "Session anchor publish failed";
    return result;
  }

  committed_tx_id_ = tx_id;
  committed_root_ = result.merkle_root;
  result.tx_id = std::move(tx_id);
  spdlog::info("session {} committed {} anchors in {}",
               trustgate::common::short_key(session_id_), anchors_.size(),
               result.tx_id.value());
  return result;
}

const std::vector<anchor_point_t>& anchor_chain::anchors() const {
  return anchors_;
}

const hash_hex_t& anchor_chain::head_hash() const {
  return head_hash_;
}

const std::string& anchor_chain::session_id() const {
  return session_id_;
}

const public_key_t& anchor_chain::agent_public_key() const {
  return agent_public_key_;
}

std::size_t anchor_chain::anchor_count() const {
  return anchors_.size();
}

const std::optional<std::string>& anchor_chain::committed_tx_id() const {
  return committed_tx_id_;
}

}  // namespace trustgate::audit
