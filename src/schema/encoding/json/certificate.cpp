#include <trustgate/schema/encoding/json/certificate.hpp>
#include <trustgate/schema/encoding/json/encoder.hpp>

#include <stdexcept>
#include <string>

using namespace trustgate::schema;

namespace trustgate::schema {

namespace {

nlohmann::json unsigned_certificate(const certificate<1>& o) {
  return nlohmann::json{{"type", o.type},
                        {"serialNumber", o.serial_number},
                        {"subject", o.subject},
                        {"certifier", o.certifier},
                        {"revocationOutpoint", o.revocation_outpoint},
                        {"fields", o.fields}};
}

}  // namespace

void to_json(nlohmann::json& j, const certificate<1>& o) {
  j = unsigned_certificate(o);
  j["signature"] = o.signature;
}

void from_json(const nlohmann::json& j, certificate<1>& o) {
  j.at("type").get_to(o.type);
  j.at("serialNumber").get_to(o.serial_number);
  j.at("subject").get_to(o.subject);
  j.at("certifier").get_to(o.certifier);
  j.at("revocationOutpoint").get_to(o.revocation_outpoint);
  j.at("fields").get_to(o.fields);
  j.at("signature").get_to(o.signature);
}

void to_json(nlohmann::json& j, const issued_certificate<1>& o) {
  j = nlohmann::json{{"certificate", o.certificate},
                     {"issuedAt", o.issued_at},
                     {"issuedBy", o.issued_by},
                     {"subjectPublicKey", o.subject},
                     {"certificateType", std::string{to_string(o.certificate_type)}},
                     {"revoked", o.revoked},
                     {"revocationPropagated", o.revocation_propagated}};
  if (o.revoked_at) {
    j["revokedAt"] = o.revoked_at.value();
  }
  if (o.revoked_by) {
    j["revokedBy"] = o.revoked_by.value();
  }
  if (o.revocation_reason) {
    j["revocationReason"] = o.revocation_reason.value();
  }
}

void from_json(const nlohmann::json& j, issued_certificate<1>& o) {
  j.at("certificate").get_to(o.certificate);
  j.at("issuedAt").get_to(o.issued_at);
  j.at("issuedBy").get_to(o.issued_by);
  j.at("subjectPublicKey").get_to(o.subject);
  auto type = try_from_string<certificate_type_t>(
      j.at("certificateType").get<std::string>());
  if (!type) {
    throw std::invalid_argument{"unknown certificateType"};
  }
  o.certificate_type = type.value();
  j.at("revoked").get_to(o.revoked);
  o.revocation_propagated = j.value("revocationPropagated", true);
  if (j.contains("revokedAt")) {
    o.revoked_at = j.at("revokedAt").get<timestamp_milliseconds_t>();
  }
  if (j.contains("revokedBy")) {
    o.revoked_by = j.at("revokedBy").get<std::string>();
  }
  if (j.contains("revocationReason")) {
    o.revocation_reason = j.at("revocationReason").get<std::string>();
  }
}

}  // namespace trustgate::schema

namespace trustgate::schema::encoding::json {

std::string certificate_signing_payload(const certificate_t& certificate) {
  return canonical(unsigned_certificate(certificate));
}

}  // namespace trustgate::schema::encoding::json
