#pragma once

#include <trustgate/schema/audit_entry.hpp>

#include <nlohmann/json.hpp>

#include <string>

namespace trustgate::schema {

void to_json(nlohmann::json& j, const audit_entry<1>& o);
void from_json(const nlohmann::json& j, audit_entry<1>& o);

void to_json(nlohmann::json& j, const blockchain_anchor<1>& o);
void from_json(const nlohmann::json& j, blockchain_anchor<1>& o);

void to_json(nlohmann::json& j, const audit_chain& o);
void from_json(const nlohmann::json& j, audit_chain& o);

}  // namespace trustgate::schema

namespace trustgate::schema::encoding::json {

/// Canonical JSON of the entry without its signature. `metadata` appears only
/// when present.
std::string audit_signing_payload(const trustgate::schema::audit_entry_t& entry);

}  // namespace trustgate::schema::encoding::json
