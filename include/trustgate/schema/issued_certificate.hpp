#pragma once

#include <trustgate/schema/certificate.hpp>
#include <trustgate/schema/certificate_type.hpp>
#include <trustgate/schema/primitives.hpp>

#include <cstdint>
#include <optional>
#include <string>

// Schema type: issued certificate.
// Identity workflow: CA-side record of a certificate plus issuance metadata.
// The revoked flag moves from false to true once and never back; records are
// never deleted.
namespace trustgate::schema {

template <uint16_t Version>
struct issued_certificate;

template <>
struct issued_certificate<1> final {
  uint16_t version{1};
  certificate_t certificate;
  timestamp_milliseconds_t issued_at{};
  public_key_t issued_by;
  public_key_t subject;
  certificate_type_t certificate_type{certificate_type_t::employee};
  bool revoked{};
  std::optional<timestamp_milliseconds_t> revoked_at;
  std::optional<public_key_t> revoked_by;
  std::optional<std::string> revocation_reason;
  // False while the revocation commitment has not reached the ledger.
  bool revocation_propagated{true};
};

using issued_certificate_t = issued_certificate<1>;

}  // namespace trustgate::schema
