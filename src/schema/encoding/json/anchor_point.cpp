#include <trustgate/schema/encoding/json/anchor_point.hpp>

#include <stdexcept>
#include <string>

using namespace trustgate::schema;

namespace trustgate::schema {

void to_json(nlohmann::json& j, const anchor_point<1>& o) {
  j = nlohmann::json{{"id", o.id},
                     {"timestamp", o.timestamp},
                     {"type", std::string{to_string(o.type)}},
                     {"dataHash", o.data_hash},
                     {"previousHash", o.previous_hash},
                     {"summary", o.summary}};
  if (o.metadata && !o.metadata->is_null()) {
    j["metadata"] = o.metadata.value();
  }
}

void from_json(const nlohmann::json& j, anchor_point<1>& o) {
  j.at("id").get_to(o.id);
  j.at("timestamp").get_to(o.timestamp);
  auto type = try_from_string<anchor_type_t>(j.at("type").get<std::string>());
  if (!type) {
    throw std::invalid_argument{"unknown anchor type"};
  }
  o.type = type.value();
  j.at("dataHash").get_to(o.data_hash);
  j.at("previousHash").get_to(o.previous_hash);
  j.at("summary").get_to(o.summary);
  if (j.contains("metadata") && !j.at("metadata").is_null()) {
    o.metadata = j.at("metadata");
  } else {
    o.metadata.reset();
  }
}

void to_json(nlohmann::json& j, const anchor_chain_data<1>& o) {
  j = nlohmann::json{{"sessionId", o.session_id},
                     {"agentPublicKey", o.agent_public_key},
                     {"anchors", o.anchors},
                     {"headHash", o.head_hash},
                     {"merkleRoot", o.merkle_root},
                     {"createdAt", o.created_at}};
}

void from_json(const nlohmann::json& j, anchor_chain_data<1>& o) {
  j.at("sessionId").get_to(o.session_id);
  j.at("agentPublicKey").get_to(o.agent_public_key);
  j.at("anchors").get_to(o.anchors);
  j.at("headHash").get_to(o.head_hash);
  o.merkle_root = j.value("merkleRoot", std::string{});
  j.at("createdAt").get_to(o.created_at);
}

}  // namespace trustgate::schema
