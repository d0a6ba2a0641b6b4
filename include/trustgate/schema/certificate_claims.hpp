#pragma once

#include <trustgate/schema/certificate.hpp>
#include <trustgate/schema/certificate_type.hpp>
#include <trustgate/schema/primitives.hpp>

#include <map>
#include <optional>
#include <string>
#include <variant>

// Schema type: certificate claims.
// Identity workflow: typed attribute sets accepted at issuance. The CA
// flattens them into the signed string map and parses them back on import.
namespace trustgate::schema {

/// Claims for employee, admin and contractor certificates.
struct person_claims final {
  std::string name;
  std::string email;
  std::optional<std::string> department;
  std::optional<std::string> title;
  std::optional<std::string> employee_id;
  // JSON-encoded permission list, carried opaquely.
  std::optional<std::string> permissions;
};

/// Claims for bot and service certificates. `email` is the operator contact.
struct agent_claims final {
  std::string name;
  std::string email;
  std::optional<std::string> department;
  std::optional<std::string> permissions;
};

using certificate_claims_t = std::variant<person_claims, agent_claims>;

/// Custom attributes carried next to the typed claims. Keys must not collide
/// with the reserved field names.
using certificate_extensions_t = std::map<std::string, std::string>;

template <uint16_t Version>
struct certificate_request;

template <>
struct certificate_request<1> final {
  uint16_t version{1};
  public_key_t subject;
  certificate_type_t certificate_type{certificate_type_t::employee};
  certificate_claims_t claims;
  certificate_extensions_t extensions;
  // Defaults to issuance time.
  std::optional<timestamp_milliseconds_t> valid_from;
  // Defaults to issuance time plus `expires_in_days`.
  std::optional<timestamp_milliseconds_t> valid_until;
  uint32_t expires_in_days{365};
};

using certificate_request_t = certificate_request<1>;

bool is_reserved_field(std::string_view key);

/// Returns an error message when the claims do not fit the certificate type
/// or a required claim or extension key is invalid.
std::optional<std::string> validate_request(
    const certificate_request_t& request);

/// Writes claims and extensions into `fields`. Organization, type and
/// validity fields are added by the issuer.
void flatten_claims(const certificate_claims_t& claims,
                    const certificate_extensions_t& extensions,
                    certificate_fields_t& fields);

/// Rebuilds the typed claims from a signed field map.
std::optional<certificate_claims_t> try_parse_claims(
    certificate_type_t type,
    const certificate_fields_t& fields);

/// Every non-reserved field.
certificate_extensions_t extensions_of(const certificate_fields_t& fields);

}  // namespace trustgate::schema
