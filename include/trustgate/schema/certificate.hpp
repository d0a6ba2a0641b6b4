#pragma once

#include <trustgate/schema/primitives.hpp>

#include <cstdint>
#include <map>
#include <string>
#include <string_view>

// Schema type: certificate.
// Identity workflow: signed, time-bounded attestation binding a subject key to
// attributes. The signature covers the canonical JSON of every other member.
namespace trustgate::schema {

/// Signed attributes. Sorted by key, which is the order the wire form and
/// the signing payload use.
using certificate_fields_t = std::map<std::string, std::string>;

template <uint16_t Version>
struct certificate;

template <>
struct certificate<1> final {
  uint16_t version{1};
  std::string type;
  std::string serial_number;
  public_key_t subject;
  public_key_t certifier;
  std::string revocation_outpoint;
  certificate_fields_t fields;
  // Lowercase hex DER ECDSA signature.
  std::string signature;
};

using certificate_t = certificate<1>;

namespace certificate_field {
inline constexpr auto kOrganizationName = std::string_view{"organizationName"};
inline constexpr auto kOrganizationId = std::string_view{"organizationId"};
inline constexpr auto kCertificateType = std::string_view{"certificateType"};
inline constexpr auto kName = std::string_view{"name"};
inline constexpr auto kEmail = std::string_view{"email"};
inline constexpr auto kDepartment = std::string_view{"department"};
inline constexpr auto kTitle = std::string_view{"title"};
inline constexpr auto kEmployeeId = std::string_view{"employeeId"};
inline constexpr auto kPermissions = std::string_view{"permissions"};
inline constexpr auto kValidFrom = std::string_view{"validFrom"};
inline constexpr auto kValidUntil = std::string_view{"validUntil"};
}  // namespace certificate_field

}  // namespace trustgate::schema
