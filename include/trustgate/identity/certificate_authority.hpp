#pragma once

#include <trustgate/common/clock.hpp>
#include <trustgate/crypto/signing_capability.hpp>
#include <trustgate/ledger/ledger_capability.hpp>
#include <trustgate/schema/certificate.hpp>
#include <trustgate/schema/certificate_claims.hpp>
#include <trustgate/schema/issued_certificate.hpp>
#include <trustgate/schema/verification_result.hpp>
#include <trustgate/storage/rocksdb/storage.hpp>

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace trustgate::identity {

struct certificate_authority_options final {
  std::string organization_name;
  // Random 8-byte hex when not configured.
  std::optional<std::string> organization_id;
  std::vector<trustgate::schema::public_key_t> trusted_certifiers;
  std::chrono::milliseconds signing_timeout{5000};
  std::chrono::milliseconds ledger_timeout{5000};
};

/// Issues and revokes identity certificates and keeps the record of every
/// certificate it has issued.
///
/// Revocation flips the local record first and then publishes a revocation
/// commitment by spending the certificate's revocation outpoint on the
/// ledger, when one is attached. A failed publish is logged, reported in the
/// result and queued for `retry_pending_revocations()`.
///
/// When a store is attached, every record change is written through and the
/// registry is reloaded on construction.
class certificate_authority final {
 public:
  certificate_authority(
      std::shared_ptr<trustgate::crypto::signing_capability> signer,
      certificate_authority_options options,
      trustgate::common::clock_fn_t clock = trustgate::common::system_clock(),
      std::shared_ptr<trustgate::ledger::ledger_capability> ledger = nullptr,
      const trustgate::storage::rocksdb_storage_t* store = nullptr);

  certificate_authority(const certificate_authority&) = delete;
  certificate_authority& operator=(const certificate_authority&) = delete;
  certificate_authority(certificate_authority&&) = delete;
  certificate_authority& operator=(certificate_authority&&) = delete;

  trustgate::schema::issuance_result_t issue_certificate(
      const trustgate::schema::certificate_request_t& request);

  trustgate::schema::issuance_result_t issue_certificate(
      const trustgate::schema::public_key_t& subject,
      trustgate::schema::certificate_type_t type,
      const trustgate::schema::certificate_claims_t& claims,
      uint32_t expires_in_days = 365);

  /// Idempotent: revoking a revoked certificate reports success without
  /// touching the record or the ledger.
  trustgate::schema::revocation_result_t revoke_certificate(
      const std::string& serial_number,
      const std::string& reason,
      const std::optional<trustgate::schema::public_key_t>& revoked_by =
          std::nullopt);

  /// Re-publishes queued revocations. Returns how many reached the ledger.
  std::size_t retry_pending_revocations();
  std::vector<std::string> pending_revocations() const;

  trustgate::schema::certificate_verification_result_t verify_certificate(
      const trustgate::schema::certificate_t& certificate) const;

  /// First certificate issued to `public_key` that verifies.
  trustgate::schema::certificate_verification_result_t has_valid_certificate(
      const trustgate::schema::public_key_t& public_key) const;

  /// Verifies a certificate from another trusted certifier and, when valid,
  /// records it.
  trustgate::schema::certificate_verification_result_t import_certificate(
      const trustgate::schema::certificate_t& certificate);

  std::optional<trustgate::schema::issued_certificate_t> find_certificate(
      const std::string& serial_number) const;
  std::vector<trustgate::schema::issued_certificate_t> certificates_for_subject(
      const trustgate::schema::public_key_t& public_key) const;
  std::vector<trustgate::schema::issued_certificate_t> all_certificates() const;
  std::vector<trustgate::schema::issued_certificate_t> revoked_certificates()
      const;
  /// Serial numbers of every revoked certificate.
  std::vector<std::string> revocation_list() const;

  void add_trusted_certifier(const trustgate::schema::public_key_t& public_key);
  /// Returns false, leaving the set unchanged, for the CA's own key.
  bool remove_trusted_certifier(
      const trustgate::schema::public_key_t& public_key);
  bool is_trusted_certifier(
      const trustgate::schema::public_key_t& public_key) const;
  std::vector<trustgate::schema::public_key_t> trusted_certifiers() const;

  const trustgate::schema::public_key_t& certifier_public_key() const;
  const std::string& organization_name() const;
  const std::string& organization_id() const;

 private:
  std::string generate_serial_number(
      trustgate::schema::timestamp_milliseconds_t now);
  bool publish_revocation(const trustgate::schema::issued_certificate_t& record);
  void persist(const trustgate::schema::issued_certificate_t& record) const;

  std::shared_ptr<trustgate::crypto::signing_capability> signer_;
  std::shared_ptr<trustgate::ledger::ledger_capability> ledger_;
  const trustgate::storage::rocksdb_storage_t* store_;
  trustgate::common::clock_fn_t clock_;
  std::chrono::milliseconds signing_timeout_;
  std::chrono::milliseconds ledger_timeout_;
  std::string organization_name_;
  std::string organization_id_;
  trustgate::schema::public_key_t certifier_public_key_;

  mutable std::mutex mutex_;
  std::set<trustgate::schema::public_key_t, std::less<>> trusted_certifiers_;
  std::map<std::string, trustgate::schema::issued_certificate_t, std::less<>>
      issued_;
  std::set<std::string, std::less<>> reserved_serials_;
  std::set<std::string, std::less<>> pending_revocations_;
};

}  // namespace trustgate::identity
