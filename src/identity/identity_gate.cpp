#include <trustgate/common/format.hpp>
#include <trustgate/identity/identity_gate.hpp>

#include <fmt/format.h>

#include <iterator>
#include <utility>

using namespace trustgate::schema;

namespace trustgate::identity {

identity_gate::identity_gate(
    std::shared_ptr<trustgate::crypto::signing_capability> signer,
    std::shared_ptr<revocation_checker> revocations,
    identity_gate_options options,
    trustgate::common::clock_fn_t clock)
    : verifier_{std::make_shared<certificate_verifier>(
          std::move(signer), std::move(revocations),
          certificate_verifier_options{std::move(options.trusted_certifiers),
                                       options.success_ttl, options.failure_ttl,
                                       options.signing_timeout},
          std::move(clock))},
      require_certificate_{options.require_certificate} {
  if (!require_certificate_) {
    spdlog::warn(
        "identity gate running without required certificates; unknown keys "
        "pass as unverified");
  }
}

certificate_verification_result_t identity_gate::verify_identity(
    const certificate_t& certificate) {
  return verifier_->verify(certificate);
}

certificate_verification_result_t identity_gate::verify_by_public_key(
    const public_key_t& public_key) {
  auto certificate = registered_certificate(public_key);
  if (certificate) {
    return verify_identity(certificate.value());
  }

  auto result = certificate_verification_result_t{};
  if (require_certificate_) {
    result.error = trust_error_code::no_certificate_registered;
    result.message = "No certificate registered for this public key";
    return result;
  }
  spdlog::debug("admitting {} without a certificate",
                trustgate::common::short_key(public_key));
  result.valid = true;
  result.certificate_type = certificate_type_t::unverified;
  return result;
}

certificate_verification_result_t identity_gate::register_certificate(
    const certificate_t& certificate) {
  auto result = verify_identity(certificate);
  if (!result.valid) {
    return result;
  }

  auto replaced = revocation_subscription{};
  auto revoked = false;
  {
    auto lock = std::scoped_lock{mutex_};
    // revoke_certificate() records the serial before unregistering it, so a
    // racing revocation is either visible here or unregisters afterwards.
    revoked = verifier_->is_locally_revoked(certificate.serial_number);
    auto previous = registered_.find(certificate.subject);
    if (!revoked && previous != std::end(registered_) &&
        previous->second.serial_number != certificate.serial_number) {
      auto it = subscriptions_.find(previous->second.serial_number);
      if (it != std::end(subscriptions_)) {
        replaced = std::move(it->second);
        subscriptions_.erase(it);
      }
    }
    if (!revoked) {
      registered_.insert_or_assign(certificate.subject, certificate);
    }
  }
  if (revoked) {
    return verify_identity(certificate);
  }

  auto subscription = verifier_->revocations()->subscribe_to_revocation(
      certificate,
      [weak = std::weak_ptr<certificate_verifier>{verifier_}](
          const std::string& serial) {
        spdlog::info("revocation observed for certificate {}", serial);
        if (auto verifier = weak.lock()) {
          verifier->invalidate(serial);
        }
      });
  {
    auto lock = std::scoped_lock{mutex_};
    auto it = registered_.find(certificate.subject);
    revoked = it == std::end(registered_) ||
              it->second.serial_number != certificate.serial_number;
    if (!revoked) {
      std::swap(subscriptions_[certificate.serial_number], subscription);
    }
  }
  if (revoked) {
    spdlog::info("certificate {} unregistered while subscribing",
                 certificate.serial_number);
    return verify_identity(certificate);
  }

  spdlog::info("registered certificate {} for {}", certificate.serial_number,
               trustgate::common::short_key(certificate.subject));
  return result;
}

std::optional<certificate_t> identity_gate::registered_certificate(
    const public_key_t& public_key) const {
  auto lock = std::scoped_lock{mutex_};
  auto it = registered_.find(public_key);
  if (it == std::end(registered_)) {
    return std::nullopt;
  }
  return it->second;
}

std::size_t identity_gate::registered_count() const {
  auto lock = std::scoped_lock{mutex_};
  return registered_.size();
}

std::size_t identity_gate::subscription_count() const {
  auto lock = std::scoped_lock{mutex_};
  return subscriptions_.size();
}

void identity_gate::revoke_certificate(
    const std::string& serial,
    const std::optional<std::string>& reason) {
  verifier_->revoke_certificate(serial, reason);
  unregister_serial(serial);
}

void identity_gate::sync_revocations(const std::vector<std::string>& serials) {
  for (const auto& serial : serials) {
    revoke_certificate(serial, "Synced from revocation list");
  }
}

std::vector<std::string> identity_gate::refresh_revocations() {
  auto certificates = std::vector<certificate_t>{};
  {
    auto lock = std::scoped_lock{mutex_};
    certificates.reserve(registered_.size());
    for (const auto& [key, certificate] : registered_) {
      certificates.push_back(certificate);
    }
  }

  auto revoked = std::vector<std::string>{};
  auto statuses =
      verifier_->revocations()->batch_check_revocations(certificates);
  for (const auto& [serial, is_revoked] : statuses) {
    if (is_revoked) {
      revoke_certificate(serial, "Revocation observed by checker");
      revoked.push_back(serial);
    }
  }
  if (!revoked.empty()) {
    spdlog::info("revocation refresh dropped {} of {} registered certificates",
                 revoked.size(), certificates.size());
  }
  return revoked;
}

void identity_gate::add_trusted_certifier(const public_key_t& public_key) {
  verifier_->add_trusted_certifier(public_key);
}

void identity_gate::remove_trusted_certifier(const public_key_t& public_key) {
  verifier_->remove_trusted_certifier(public_key);
}

void identity_gate::clear_cache() {
  verifier_->clear_cache();
}

bool identity_gate::require_certificate() const {
  return require_certificate_;
}

certificate_verifier& identity_gate::verifier() {
  return *verifier_;
}

const certificate_verifier& identity_gate::verifier() const {
  return *verifier_;
}

void identity_gate::unregister_serial(const std::string& serial) {
  auto subscription = revocation_subscription{};
  {
    auto lock = std::scoped_lock{mutex_};
    for (auto it = std::begin(registered_); it != std::end(registered_);) {
      if (it->second.serial_number == serial) {
        it = registered_.erase(it);
      } else {
        ++it;
      }
    }
    auto it = subscriptions_.find(serial);
    if (it != std::end(subscriptions_)) {
      subscription = std::move(it->second);
      subscriptions_.erase(it);
    }
  }
}

access_denied::access_denied(std::string operation,
                             std::optional<trust_error_code> code,
                             std::string reason)
    : std::runtime_error{fmt::format("[{}] Access denied: {}", operation,
                                     reason)},
      operation_{std::move(operation)},
      code_{code},
      reason_{std::move(reason)} {}

const std::string& access_denied::operation() const noexcept {
  return operation_;
}

std::optional<trust_error_code> access_denied::code() const noexcept {
  return code_;
}

const std::string& access_denied::reason() const noexcept {
  return reason_;
}

}  // namespace trustgate::identity
