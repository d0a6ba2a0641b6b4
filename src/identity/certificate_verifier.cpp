#include <trustgate/blake3/hash.hpp>
#include <trustgate/common/critical.hpp>
#include <trustgate/common/format.hpp>
#include <trustgate/identity/certificate_checks.hpp>
#include <trustgate/identity/certificate_verifier.hpp>
#include <trustgate/schema/encoding/json/certificate.hpp>
#include <trustgate/schema/encoding/json/encoder.hpp>

#include <spdlog/spdlog.h>

#include <iterator>
#include <utility>

using namespace trustgate::schema;

namespace trustgate::identity {

namespace {

hash_hex_t fingerprint_of(const certificate_t& certificate) {
  return trustgate::blake3::hash_hex(
      trustgate::schema::encoding::json::to_canonical(certificate));
}

}  // namespace

certificate_verifier::certificate_verifier(
    std::shared_ptr<trustgate::crypto::signing_capability> signer,
    std::shared_ptr<revocation_checker> revocations,
    certificate_verifier_options options,
    trustgate::common::clock_fn_t clock)
    : signer_{std::move(signer)},
      revocations_{std::move(revocations)},
      clock_{std::move(clock)},
      success_ttl_{options.success_ttl},
      failure_ttl_{options.failure_ttl},
      signing_timeout_{options.signing_timeout},
      trusted_certifiers_{std::begin(options.trusted_certifiers),
                          std::end(options.trusted_certifiers)} {
  if (!signer_ || !revocations_) {
    trustgate::common::critical(
        "certificate verifier requires a signer and a revocation checker");
  }
}

certificate_verification_result_t certificate_verifier::verify(
    const certificate_t& certificate) {
  auto fingerprint = fingerprint_of(certificate);
  auto generation = uint64_t{};
  {
    auto lock = std::scoped_lock{mutex_};
    generation = generation_;
    auto it = cache_.find(certificate.serial_number);
    if (it != std::end(cache_)) {
      if (clock_() > it->second.expires_at) {
        cache_.erase(it);
      } else if (it->second.fingerprint == fingerprint) {
        spdlog::debug("verification cache hit for {}",
                      certificate.serial_number);
        return it->second.result;
      }
    }
  }

  auto checks = certificate_checks{};
  checks.now = clock_();
  checks.is_trusted = [this](const public_key_t& certifier) {
    return is_trusted_certifier(certifier);
  };
  checks.revocation_reason =
      [this](const certificate_t& cert) -> std::optional<std::string> {
    auto lock = std::scoped_lock{mutex_};
    auto it = revoked_.find(cert.serial_number);
    if (it == std::end(revoked_)) {
      return std::nullopt;
    }
    return it->second.empty() ? std::string{"No reason provided"}
                              : it->second;
  };
  checks.is_revoked = [this](const certificate_t& cert) {
    return revocations_->is_revoked(cert);
  };
  checks.verify_signature = [this](const certificate_t& cert) {
    return verify_certificate_signature(signer_, cert, signing_timeout_);
  };

  auto result = run_certificate_checks(certificate, checks);
  if (!result.valid) {
    spdlog::warn("certificate {} for {} rejected: {}",
                 certificate.serial_number,
                 trustgate::common::short_key(certificate.subject),
                 result.message);
  }

  if (auto ttl = ttl_for(result)) {
    auto lock = std::scoped_lock{mutex_};
    if (generation == generation_) {
      cache_.insert_or_assign(
          certificate.serial_number,
          cache_entry{result, clock_() + static_cast<uint64_t>(ttl->count()),
                      certificate.certifier, std::move(fingerprint)});
    }
  }
  return result;
}

std::optional<std::chrono::milliseconds> certificate_verifier::ttl_for(
    const certificate_verification_result_t& result) const {
  if (result.valid) {
    return success_ttl_;
  }
  switch (result.error.value_or(trust_error_code::untrusted_certifier)) {
    case trust_error_code::certificate_revoked:
    case trust_error_code::certificate_expired:
    case trust_error_code::certificate_not_yet_valid:
    case trust_error_code::invalid_signature:
    case trust_error_code::invalid_certificate_fields:
      return failure_ttl_;
    default:
      return std::nullopt;
  }
}

void certificate_verifier::revoke_certificate(
    const std::string& serial,
    const std::optional<std::string>& reason) {
  auto lock = std::scoped_lock{mutex_};
  auto inserted = revoked_.try_emplace(serial, reason.value_or("")).second;
  cache_.erase(serial);
  ++generation_;
  if (inserted) {
    spdlog::info("certificate {} added to the revocation list", serial);
  }
}

void certificate_verifier::sync_revocation_list(
    const std::vector<std::string>& serials) {
  for (const auto& serial : serials) {
    revoke_certificate(serial, "Synced from revocation list");
  }
}

bool certificate_verifier::is_locally_revoked(const std::string& serial) const {
  auto lock = std::scoped_lock{mutex_};
  return revoked_.find(serial) != std::end(revoked_);
}

std::vector<std::string> certificate_verifier::revocation_list() const {
  auto lock = std::scoped_lock{mutex_};
  auto out = std::vector<std::string>{};
  out.reserve(revoked_.size());
  for (const auto& [serial, reason] : revoked_) {
    out.push_back(serial);
  }
  return out;
}

void certificate_verifier::add_trusted_certifier(
    const public_key_t& public_key) {
  auto lock = std::scoped_lock{mutex_};
  trusted_certifiers_.insert(public_key);
}

void certificate_verifier::remove_trusted_certifier(
    const public_key_t& public_key) {
  auto lock = std::scoped_lock{mutex_};
  trusted_certifiers_.erase(public_key);
  for (auto it = std::begin(cache_); it != std::end(cache_);) {
    if (it->second.certifier == public_key) {
      it = cache_.erase(it);
    } else {
      ++it;
    }
  }
  ++generation_;
}

bool certificate_verifier::is_trusted_certifier(
    const public_key_t& public_key) const {
  auto lock = std::scoped_lock{mutex_};
  return trusted_certifiers_.contains(public_key);
}

std::vector<public_key_t> certificate_verifier::trusted_certifiers() const {
  auto lock = std::scoped_lock{mutex_};
  return {std::begin(trusted_certifiers_), std::end(trusted_certifiers_)};
}

void certificate_verifier::invalidate(const std::string& serial) {
  auto lock = std::scoped_lock{mutex_};
  cache_.erase(serial);
  ++generation_;
}

void certificate_verifier::clear_cache() {
  auto lock = std::scoped_lock{mutex_};
  cache_.clear();
  ++generation_;
}

std::size_t certificate_verifier::cache_size() const {
  auto lock = std::scoped_lock{mutex_};
  return cache_.size();
}

const std::shared_ptr<revocation_checker>& certificate_verifier::revocations()
    const {
  return revocations_;
}

}  // namespace trustgate::identity
