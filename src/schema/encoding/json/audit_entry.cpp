#include <trustgate/schema/encoding/json/audit_entry.hpp>
#include <trustgate/schema/encoding/json/encoder.hpp>

using namespace trustgate::schema;

namespace trustgate::schema {

namespace {

nlohmann::json unsigned_entry(const audit_entry<1>& o) {
  auto j = nlohmann::json{{"entryId", o.entry_id},
                          {"timestamp", o.timestamp},
                          {"action", o.action},
                          {"userPublicKeyHash", o.user_public_key_hash},
                          {"agentPublicKey", o.agent_public_key},
                          {"inputHash", o.input_hash},
                          {"outputHash", o.output_hash},
                          {"previousEntryHash", o.previous_entry_hash}};
  if (o.metadata && !o.metadata->is_null()) {
    j["metadata"] = o.metadata.value();
  }
  return j;
}

}  // namespace

void to_json(nlohmann::json& j, const audit_entry<1>& o) {
  j = unsigned_entry(o);
  j["signature"] = o.signature;
}

void from_json(const nlohmann::json& j, audit_entry<1>& o) {
  j.at("entryId").get_to(o.entry_id);
  j.at("timestamp").get_to(o.timestamp);
  j.at("action").get_to(o.action);
  j.at("userPublicKeyHash").get_to(o.user_public_key_hash);
  j.at("agentPublicKey").get_to(o.agent_public_key);
  j.at("inputHash").get_to(o.input_hash);
  j.at("outputHash").get_to(o.output_hash);
  j.at("previousEntryHash").get_to(o.previous_entry_hash);
  j.at("signature").get_to(o.signature);
  if (j.contains("metadata") && !j.at("metadata").is_null()) {
    o.metadata = j.at("metadata");
  } else {
    o.metadata.reset();
  }
}

void to_json(nlohmann::json& j, const blockchain_anchor<1>& o) {
  j = nlohmann::json{{"txId", o.tx_id},
                     {"blockHeight", o.block_height},
                     {"timestamp", o.timestamp},
                     {"entryHashes", o.entry_hashes}};
}

void from_json(const nlohmann::json& j, blockchain_anchor<1>& o) {
  j.at("txId").get_to(o.tx_id);
  j.at("blockHeight").get_to(o.block_height);
  j.at("timestamp").get_to(o.timestamp);
  j.at("entryHashes").get_to(o.entry_hashes);
}

void to_json(nlohmann::json& j, const audit_chain& o) {
  j = nlohmann::json{{"entries", o.entries},
                     {"headHash", o.head_hash},
                     {"blockchainAnchors", o.blockchain_anchors}};
}

void from_json(const nlohmann::json& j, audit_chain& o) {
  j.at("entries").get_to(o.entries);
  j.at("headHash").get_to(o.head_hash);
  o.blockchain_anchors.clear();
  if (j.contains("blockchainAnchors")) {
    j.at("blockchainAnchors").get_to(o.blockchain_anchors);
  }
}

}  // namespace trustgate::schema

namespace trustgate::schema::encoding::json {

std::string audit_signing_payload(const audit_entry_t& entry) {
  return canonical(unsigned_entry(entry));
}

}  // namespace trustgate::schema::encoding::json
