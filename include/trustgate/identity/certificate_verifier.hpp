#pragma once

#include <trustgate/common/clock.hpp>
#include <trustgate/crypto/signing_capability.hpp>
#include <trustgate/identity/revocation_checker.hpp>
#include <trustgate/schema/certificate.hpp>
#include <trustgate/schema/verification_result.hpp>

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace trustgate::identity {

struct certificate_verifier_options final {
  std::vector<trustgate::schema::public_key_t> trusted_certifiers;
  std::chrono::milliseconds success_ttl{60000};
  std::chrono::milliseconds failure_ttl{10000};
  std::chrono::milliseconds signing_timeout{5000};
};

/// Runs the ordered certificate checks behind a result cache keyed by serial
/// number.
///
/// Successes are cached for `success_ttl`, definitive failures (revoked,
/// expired, not yet valid, bad signature, malformed dates) for the shorter
/// `failure_ttl`. Untrusted certifiers and unavailable capabilities are never
/// cached. A cached result is only served for a byte-identical certificate.
class certificate_verifier final {
 public:
  certificate_verifier(
      std::shared_ptr<trustgate::crypto::signing_capability> signer,
      std::shared_ptr<revocation_checker> revocations,
      certificate_verifier_options options,
      trustgate::common::clock_fn_t clock = trustgate::common::system_clock());

  certificate_verifier(const certificate_verifier&) = delete;
  certificate_verifier& operator=(const certificate_verifier&) = delete;

  trustgate::schema::certificate_verification_result_t verify(
      const trustgate::schema::certificate_t& certificate);

  /// Marks `serial` revoked in the local list and drops its cache entry.
  /// Idempotent.
  void revoke_certificate(const std::string& serial,
                          const std::optional<std::string>& reason =
                              std::nullopt);
  void sync_revocation_list(const std::vector<std::string>& serials);
  bool is_locally_revoked(const std::string& serial) const;
  std::vector<std::string> revocation_list() const;

  void add_trusted_certifier(const trustgate::schema::public_key_t& public_key);
  /// Also drops every cached result for certificates from that certifier.
  void remove_trusted_certifier(
      const trustgate::schema::public_key_t& public_key);
  bool is_trusted_certifier(
      const trustgate::schema::public_key_t& public_key) const;
  std::vector<trustgate::schema::public_key_t> trusted_certifiers() const;

  void invalidate(const std::string& serial);
  void clear_cache();
  std::size_t cache_size() const;

  const std::shared_ptr<revocation_checker>& revocations() const;

 private:
  struct cache_entry final {
    trustgate::schema::certificate_verification_result_t result;
    trustgate::schema::timestamp_milliseconds_t expires_at{};
    trustgate::schema::public_key_t certifier;
    trustgate::schema::hash_hex_t fingerprint;
  };

  std::optional<std::chrono::milliseconds> ttl_for(
      const trustgate::schema::certificate_verification_result_t& result)
      const;

  std::shared_ptr<trustgate::crypto::signing_capability> signer_;
  std::shared_ptr<revocation_checker> revocations_;
  trustgate::common::clock_fn_t clock_;
  std::chrono::milliseconds success_ttl_;
  std::chrono::milliseconds failure_ttl_;
  std::chrono::milliseconds signing_timeout_;

  mutable std::mutex mutex_;
  std::set<trustgate::schema::public_key_t, std::less<>> trusted_certifiers_;
  // Serial to reason; an empty reason was not supplied.
  std::map<std::string, std::string, std::less<>> revoked_;
  std::map<std::string, cache_entry, std::less<>> cache_;
  // Bumped by every invalidation so a verification that raced one does not
  // repopulate the cache with a stale result.
  uint64_t generation_{};
};

}  // namespace trustgate::identity
