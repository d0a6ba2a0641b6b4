#pragma once

#include <trustgate/schema/certificate.hpp>
#include <trustgate/schema/issued_certificate.hpp>

#include <nlohmann/json.hpp>

#include <string>

namespace trustgate::schema {

void to_json(nlohmann::json& j, const certificate<1>& o);
void from_json(const nlohmann::json& j, certificate<1>& o);

void to_json(nlohmann::json& j, const issued_certificate<1>& o);
void from_json(const nlohmann::json& j, issued_certificate<1>& o);

}  // namespace trustgate::schema

namespace trustgate::schema::encoding::json {

/// Canonical JSON of every certificate member except the signature. This is
/// the byte string the certifier signs.
std::string certificate_signing_payload(
    const trustgate::schema::certificate_t& certificate);

}  // namespace trustgate::schema::encoding::json
