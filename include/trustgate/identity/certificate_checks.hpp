#pragma once

#include <trustgate/crypto/signing_capability.hpp>
#include <trustgate/schema/certificate.hpp>
#include <trustgate/schema/verification_result.hpp>

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>

namespace trustgate::identity {

inline const auto kCertificateProtocol =
    trustgate::crypto::protocol_id_t{2, "certificate signing"};

/// `cert-<serial>`
std::string certificate_key_id(const std::string& serial_number);

/// Validity window from `validFrom`/`validUntil`. A missing bound is open;
/// std::nullopt when a present bound is not ISO-8601.
std::optional<std::pair<trustgate::schema::timestamp_milliseconds_t,
                        trustgate::schema::timestamp_milliseconds_t>>
validity_window(const trustgate::schema::certificate_t& certificate);

/// Checks the certifier signature under the `anyone` counterparty named after
/// the certifier. std::nullopt when the signer timed out or failed.
std::optional<bool> verify_certificate_signature(
    const std::shared_ptr<trustgate::crypto::signing_capability>& signer,
    const trustgate::schema::certificate_t& certificate,
    std::chrono::milliseconds timeout);

/// Lookups the ordered checks consult. Each runs only when every earlier
/// check passed.
struct certificate_checks final {
  std::function<bool(const trustgate::schema::public_key_t&)> is_trusted;
  std::function<std::optional<std::string>(
      const trustgate::schema::certificate_t&)>
      revocation_reason;
  // std::nullopt when the revocation source is unavailable.
  std::function<std::optional<bool>(const trustgate::schema::certificate_t&)>
      is_revoked;
  std::function<std::optional<bool>(const trustgate::schema::certificate_t&)>
      verify_signature;
  trustgate::schema::timestamp_milliseconds_t now{};
};

/// Trusted certifier, not revoked, inside the validity window, signature.
/// Short-circuits on the first failure.
trustgate::schema::certificate_verification_result_t run_certificate_checks(
    const trustgate::schema::certificate_t& certificate,
    const certificate_checks& checks);

}  // namespace trustgate::identity
