#include <trustgate/common/clock.hpp>
#include <trustgate/common/deadline.hpp>
#include <trustgate/identity/certificate_checks.hpp>
#include <trustgate/schema/encoding/json/certificate.hpp>

#include <fmt/format.h>

#include <limits>

using namespace trustgate::schema;

namespace trustgate::identity {

namespace {

certificate_verification_result_t failure(const certificate_t& certificate,
                                          const trust_error_code code,
                                          std::string message) {
  auto result = certificate_verification_result_t{};
  result.valid = false;
  result.error = code;
  result.message = std::move(message);
  result.certificate = certificate;
  return result;
}

}  // namespace

std::string certificate_key_id(const std::string& serial_number) {
  return fmt::format("cert-{}", serial_number);
}

std::optional<std::pair<timestamp_milliseconds_t, timestamp_milliseconds_t>>
validity_window(const certificate_t& certificate) {
  auto from = timestamp_milliseconds_t{0};
  auto until = std::numeric_limits<timestamp_milliseconds_t>::max();

  auto from_field =
      certificate.fields.find(std::string{certificate_field::kValidFrom});
  if (from_field != std::end(certificate.fields)) {
    auto parsed = trustgate::common::parse_iso8601(from_field->second);
    if (!parsed) {
      return std::nullopt;
    }
    from = parsed.value();
  }

  auto until_field =
      certificate.fields.find(std::string{certificate_field::kValidUntil});
  if (until_field != std::end(certificate.fields)) {
    auto parsed = trustgate::common::parse_iso8601(until_field->second);
    if (!parsed) {
      return std::nullopt;
    }
    until = parsed.value();
  }
  return std::pair{from, until};
}

std::optional<bool> verify_certificate_signature(
    const std::shared_ptr<trustgate::crypto::signing_capability>& signer,
    const certificate_t& certificate,
    const std::chrono::milliseconds timeout) {
  auto signature = try_from_hex(certificate.signature);
  if (!signature || signature->empty()) {
    return false;
  }
  auto payload =
      trustgate::schema::encoding::json::certificate_signing_payload(
          certificate);
  return trustgate::common::call_with_deadline(
      "certificate signature verification",
      trustgate::common::deadline_for(*signer, timeout),
      [signer, payload = std::move(payload),
       signature = std::move(signature.value()),
       key_id = certificate_key_id(certificate.serial_number),
       certifier = certificate.certifier] {
        return signer->verify(make_bytes_view(payload),
                              make_bytes_view(signature), kCertificateProtocol,
                              key_id,
                              trustgate::crypto::counterparty_anyone{certifier});
      });
}

certificate_verification_result_t run_certificate_checks(
    const certificate_t& certificate,
    const certificate_checks& checks) {
  if (!checks.is_trusted(certificate.certifier)) {
    auto result = failure(certificate, trust_error_code::untrusted_certifier,
                          "Certificate issued by untrusted certifier");
    result.certificate.reset();
    return result;
  }

  auto reason = checks.revocation_reason
                    ? checks.revocation_reason(certificate)
                    : std::optional<std::string>{};
  auto revoked = reason.has_value() ? std::optional<bool>{true}
                                    : checks.is_revoked(certificate);
  if (!revoked.has_value()) {
    return failure(certificate, trust_error_code::ledger_unavailable,
                   "Revocation status unavailable");
  }
  if (revoked.value()) {
    auto result =
        failure(certificate, trust_error_code::certificate_revoked,
                reason ? fmt::format("Certificate revoked: {}", reason.value())
                       : std::string{"Certificate has been revoked"});
    result.revoked = true;
    return result;
  }

  auto window = validity_window(certificate);
  if (!window) {
    return failure(certificate, trust_error_code::invalid_certificate_fields,
                   "Certificate validity dates are malformed");
  }
  if (checks.now < window->first) {
    auto result = failure(certificate,
                          trust_error_code::certificate_not_yet_valid,
                          "Certificate not yet valid");
    result.not_yet_valid = true;
    return result;
  }
  if (checks.now > window->second) {
    auto result = failure(certificate, trust_error_code::certificate_expired,
                          "Certificate has expired");
    result.expired = true;
    return result;
  }

  auto verified = checks.verify_signature(certificate);
  if (!verified.has_value()) {
    return failure(certificate, trust_error_code::signing_unavailable,
                   "Signature verification unavailable");
  }
  if (!verified.value()) {
    return failure(certificate, trust_error_code::invalid_signature,
                   "Invalid certificate signature");
  }

  auto result = certificate_verification_result_t{};
  result.valid = true;
  result.certificate = certificate;
  auto type_field =
      certificate.fields.find(std::string{certificate_field::kCertificateType});
  if (type_field != std::end(certificate.fields)) {
    result.certificate_type =
        try_from_string<certificate_type_t>(type_field->second);
  }
  return result;
}

}  // namespace trustgate::identity
