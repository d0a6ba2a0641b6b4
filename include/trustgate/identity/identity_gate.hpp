#pragma once

#include <trustgate/common/clock.hpp>
#include <trustgate/crypto/signing_capability.hpp>
#include <trustgate/identity/certificate_verifier.hpp>
#include <trustgate/identity/revocation_checker.hpp>
#include <trustgate/schema/certificate.hpp>
#include <trustgate/schema/trust_error_code.hpp>
#include <trustgate/schema/verification_result.hpp>

#include <spdlog/spdlog.h>

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace trustgate::identity {

struct identity_gate_options final {
  std::vector<trustgate::schema::public_key_t> trusted_certifiers;
  // Off only for development: unknown keys then pass as `unverified`.
  bool require_certificate{true};
  std::chrono::milliseconds success_ttl{60000};
  std::chrono::milliseconds failure_ttl{10000};
  std::chrono::milliseconds signing_timeout{5000};
};

/// Choke-point consulted before every privileged operation: tool execution,
/// inference, data access and message encryption.
///
/// Owns a certificate_verifier and the public key to certificate registry.
/// Registered certificates are watched through the revocation checker so a
/// revocation observed there drops the cached result immediately.
class identity_gate final {
 public:
  identity_gate(
      std::shared_ptr<trustgate::crypto::signing_capability> signer,
      std::shared_ptr<revocation_checker> revocations,
      identity_gate_options options,
      trustgate::common::clock_fn_t clock = trustgate::common::system_clock());

  identity_gate(const identity_gate&) = delete;
  identity_gate& operator=(const identity_gate&) = delete;

  trustgate::schema::certificate_verification_result_t verify_identity(
      const trustgate::schema::certificate_t& certificate);

  trustgate::schema::certificate_verification_result_t verify_by_public_key(
      const trustgate::schema::public_key_t& public_key);

  /// Verifies `certificate` and, when valid, registers it for its subject.
  trustgate::schema::certificate_verification_result_t register_certificate(
      const trustgate::schema::certificate_t& certificate);

  std::optional<trustgate::schema::certificate_t> registered_certificate(
      const trustgate::schema::public_key_t& public_key) const;
  std::size_t registered_count() const;
  /// Live revocation subscriptions, one per registered serial.
  std::size_t subscription_count() const;

  void revoke_certificate(const std::string& serial,
                          const std::optional<std::string>& reason =
                              std::nullopt);
  void sync_revocations(const std::vector<std::string>& serials);

  /// Batch re-check of every registered certificate against the revocation
  /// checker. Returns the serials found revoked.
  std::vector<std::string> refresh_revocations();

  void add_trusted_certifier(const trustgate::schema::public_key_t& public_key);
  void remove_trusted_certifier(
      const trustgate::schema::public_key_t& public_key);
  void clear_cache();

  bool require_certificate() const;
  certificate_verifier& verifier();
  const certificate_verifier& verifier() const;

 private:
  void unregister_serial(const std::string& serial);

  std::shared_ptr<certificate_verifier> verifier_;
  bool require_certificate_;

  mutable std::mutex mutex_;
  std::map<trustgate::schema::public_key_t,
           trustgate::schema::certificate_t,
           std::less<>>
      registered_;
  std::map<std::string, revocation_subscription, std::less<>> subscriptions_;
};

/// Thrown by the gated wrappers when identity verification fails.
class access_denied final : public std::runtime_error {
 public:
  access_denied(std::string operation,
                std::optional<trustgate::schema::trust_error_code> code,
                std::string reason);

  const std::string& operation() const noexcept;
  std::optional<trustgate::schema::trust_error_code> code() const noexcept;
  const std::string& reason() const noexcept;

 private:
  std::string operation_;
  std::optional<trustgate::schema::trust_error_code> code_;
  std::string reason_;
};

/// Runs `operation` only when `certificate` passes the gate.
template <typename Operation>
std::invoke_result_t<Operation> gated_operation(
    identity_gate& gate,
    const trustgate::schema::certificate_t& certificate,
    Operation&& operation,
    const std::string_view name) {
  auto identity = gate.verify_identity(certificate);
  if (!identity.valid) {
    spdlog::warn("[{}] access denied for certificate {}: {}", name,
                 certificate.serial_number, identity.message);
    throw access_denied{std::string{name}, identity.error, identity.message};
  }
  return std::forward<Operation>(operation)();
}

/// Runs `operation` only when the certificate registered for `public_key`
/// passes the gate.
template <typename Operation>
std::invoke_result_t<Operation> gated_operation_by_key(
    identity_gate& gate,
    const trustgate::schema::public_key_t& public_key,
    Operation&& operation,
    const std::string_view name) {
  auto identity = gate.verify_by_public_key(public_key);
  if (!identity.valid) {
    spdlog::warn("[{}] access denied: {}", name, identity.message);
    throw access_denied{std::string{name}, identity.error, identity.message};
  }
  return std::forward<Operation>(operation)();
}

}  // namespace trustgate::identity
