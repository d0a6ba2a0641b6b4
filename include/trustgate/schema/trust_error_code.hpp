#pragma once

#include <trustgate/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: trust error code.
// Trust workflow: every recoverable rejection the trust layer reports, from
// certificate checks through session authentication to audit-chain integrity.
namespace trustgate::schema {

enum class trust_error_code : uint32_t {
  untrusted_certifier = 1,
  certificate_expired = 2,
  certificate_not_yet_valid = 3,
  certificate_revoked = 4,
  invalid_signature = 5,
  session_not_found = 6,
  session_expired = 7,
  timing_anomaly = 8,
  chain_linkage_broken = 9,
  chain_import_invalid = 10,
  certificate_not_found = 11,
  no_certificate_registered = 12,
  session_not_verified = 13,
  session_already_verified = 14,
  invalid_certificate_fields = 15,
  signing_unavailable = 16,
  ledger_unavailable = 17,
};

inline constexpr auto kTrustErrorCodeNames = enum_names_t<trust_error_code, 17>{{
     {"untrusted_certifier", trust_error_code::untrusted_certifier},
     {"certificate_expired", trust_error_code::certificate_expired},
     {"certificate_not_yet_valid", trust_error_code::certificate_not_yet_valid},
     {"certificate_revoked", trust_error_code::certificate_revoked},
     {"invalid_signature", trust_error_code::invalid_signature},
     {"session_not_found", trust_error_code::session_not_found},
     {"session_expired", trust_error_code::session_expired},
     {"timing_anomaly", trust_error_code::timing_anomaly},
     {"chain_linkage_broken", trust_error_code::chain_linkage_broken},
     {"chain_import_invalid", trust_error_code::chain_import_invalid},
     {"certificate_not_found", trust_error_code::certificate_not_found},
     {"no_certificate_registered", trust_error_code::no_certificate_registered},
     {"session_not_verified", trust_error_code::session_not_verified},
     {"session_already_verified", trust_error_code::session_already_verified},
     {"invalid_certificate_fields", trust_error_code::invalid_certificate_fields},
     {"signing_unavailable", trust_error_code::signing_unavailable},
     {"ledger_unavailable", trust_error_code::ledger_unavailable}}};

template <>
inline std::optional<trust_error_code> try_from_string<trust_error_code>(
    const std::string_view value) {
  return find_enum(value, kTrustErrorCodeNames);
}

inline constexpr std::string_view to_string(const trust_error_code value) {
  return name_of(value, kTrustErrorCodeNames);
}

}  // namespace trustgate::schema
