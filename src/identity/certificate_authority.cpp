#include <trustgate/blake3/hash.hpp>
#include <trustgate/common/critical.hpp>
#include <trustgate/common/deadline.hpp>
#include <trustgate/common/format.hpp>
#include <trustgate/crypto/random.hpp>
#include <trustgate/identity/certificate_authority.hpp>
#include <trustgate/identity/certificate_checks.hpp>
#include <trustgate/schema/encoding/json/certificate.hpp>
#include <trustgate/schema/encoding/json/encoder.hpp>
#include <trustgate/storage/records.hpp>

#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <iterator>
#include <utility>

using namespace trustgate::schema;

namespace trustgate::identity {

namespace {

inline constexpr auto kSerialRandomBytes = std::size_t{16};
inline constexpr auto kOrganizationIdBytes = std::size_t{8};

std::string to_base36(uint64_t value) {
  constexpr auto digits = std::string_view{"0123456789abcdefghijklmnopqrstuvwxyz"};
  if (value == 0) {
    return "0";
  }
  auto out = std::string{};
  while (value > 0) {
    out.push_back(digits[value % 36]);
    value /= 36;
  }
  std::reverse(std::begin(out), std::end(out));
  return out;
}

std::string revocation_commitment(const issued_certificate_t& record) {
  auto commitment = nlohmann::json{
      {"type", "trustgate-revocation"},
      {"version", 1},
      {"serialNumber", record.certificate.serial_number},
      {"revocationOutpoint", record.certificate.revocation_outpoint},
      {"certifier", record.certificate.certifier},
      {"reason", record.revocation_reason.value_or("")},
      {"revokedAt", record.revoked_at.value_or(0)}};
  return trustgate::schema::encoding::json::canonical(commitment);
}

// Configured id wins; otherwise the store keeps one id across restarts.
std::string resolve_organization_id(
    const std::optional<std::string>& configured,
    const trustgate::storage::rocksdb_storage_t* store) {
  auto persisted = std::optional<std::string>{};
  if (store != nullptr) {
    persisted = trustgate::storage::load_organization_id(*store);
  }
  if (configured && persisted && persisted.value() != configured.value()) {
    spdlog::warn("organization id changed from {} to {}", persisted.value(),
                 configured.value());
  }
  auto id = configured.value_or(persisted.value_or(
      trustgate::crypto::random_hex(kOrganizationIdBytes)));
  if (store != nullptr && persisted != id) {
    trustgate::storage::save_organization_id(*store, id);
  }
  return id;
}

}  // namespace

certificate_authority::certificate_authority(
    std::shared_ptr<trustgate::crypto::signing_capability> signer,
    certificate_authority_options options,
    trustgate::common::clock_fn_t clock,
    std::shared_ptr<trustgate::ledger::ledger_capability> ledger,
    const trustgate::storage::rocksdb_storage_t* store)
    : signer_{std::move(signer)},
      ledger_{std::move(ledger)},
      store_{store},
      clock_{std::move(clock)},
      signing_timeout_{options.signing_timeout},
      ledger_timeout_{options.ledger_timeout},
      organization_name_{std::move(options.organization_name)},
      organization_id_{
          resolve_organization_id(options.organization_id, store)} {
  if (!signer_) {
    trustgate::common::critical("certificate authority requires a signer");
  }
  certifier_public_key_ = signer_->public_key();
  trusted_certifiers_.insert(std::begin(options.trusted_certifiers),
                             std::end(options.trusted_certifiers));
  trusted_certifiers_.insert(certifier_public_key_);

  if (store_ != nullptr) {
    for (auto& record : trustgate::storage::load_issued_certificates(*store_)) {
      if (record.revoked && !record.revocation_propagated) {
        pending_revocations_.insert(record.certificate.serial_number);
      }
      auto serial = record.certificate.serial_number;
      issued_.insert_or_assign(std::move(serial), std::move(record));
    }
  }

  spdlog::info(
      "certificate authority ready for {} ({}), certifier {}, {} certificates "
      "loaded",
      organization_name_, organization_id_,
      trustgate::common::short_key(certifier_public_key_), issued_.size());
}

std::string certificate_authority::generate_serial_number(
    const timestamp_milliseconds_t now) {
  while (true) {
    auto candidate = fmt::format("{}-{}", to_base36(now),
                                 trustgate::crypto::random_hex(
                                     kSerialRandomBytes));
    {
      auto lock = std::scoped_lock{mutex_};
      if (issued_.contains(candidate) ||
          !reserved_serials_.insert(candidate).second) {
        spdlog::warn("serial number collision on {}, regenerating", candidate);
        continue;
      }
    }
    if (store_ != nullptr &&
        store_->contains(trustgate::schema::make_bytes_view(
            trustgate::storage::make_certificate_key(candidate)))) {
      spdlog::warn("serial number {} already persisted, regenerating",
                   candidate);
      auto lock = std::scoped_lock{mutex_};
      reserved_serials_.erase(candidate);
      continue;
    }
    return candidate;
  }
}

issuance_result_t certificate_authority::issue_certificate(
    const certificate_request_t& request) {
  auto result = issuance_result_t{};
  if (auto error = validate_request(request)) {
    spdlog::warn("rejected certificate request for {}: {}",
                 trustgate::common::short_key(request.subject), error.value());
    result.error = trust_error_code::invalid_certificate_fields;
    result.message = std::move(error.value());
    return result;
  }

  auto now = clock_();
  auto valid_from = request.valid_from.value_or(now);
  auto valid_until = request.valid_until.value_or(
      now + static_cast<uint64_t>(request.expires_in_days) *
                trustgate::common::kMillisecondsPerDay);

  auto certificate = certificate_t{};
  certificate.type =
      fmt::format("{}.{}", organization_id_, to_string(request.certificate_type));
  certificate.subject = request.subject;
  certificate.certifier = certifier_public_key_;
  flatten_claims(request.claims, request.extensions, certificate.fields);
  certificate.fields[std::string{certificate_field::kOrganizationName}] =
      organization_name_;
  certificate.fields[std::string{certificate_field::kOrganizationId}] =
      organization_id_;
  certificate.fields[std::string{certificate_field::kCertificateType}] =
      std::string{to_string(request.certificate_type)};
  certificate.fields[std::string{certificate_field::kValidFrom}] =
      trustgate::common::format_iso8601(valid_from);
  certificate.fields[std::string{certificate_field::kValidUntil}] =
      trustgate::common::format_iso8601(valid_until);

  certificate.serial_number = generate_serial_number(now);
  certificate.revocation_outpoint =
      trustgate::blake3::hash_hex(fmt::format(
          "revocation:{}:{}", certificate.serial_number, now)) +
      ":0";

  auto payload =
      trustgate::schema::encoding::json::certificate_signing_payload(
          certificate);
  auto signature = trustgate::common::call_with_deadline(
      "certificate signing",
      trustgate::common::deadline_for(*signer_, signing_timeout_),
      [signer = signer_, payload = std::move(payload),
       key_id = certificate_key_id(certificate.serial_number)] {
        return signer->sign(make_bytes_view(payload), kCertificateProtocol,
                            key_id, trustgate::crypto::counterparty_anyone{});
      });
  if (!signature) {
    auto lock = std::scoped_lock{mutex_};
    reserved_serials_.erase(certificate.serial_number);
    result.error = trust_error_code::signing_unavailable;
    result.message = "Certificate signing failed";
    return result;
  }
  certificate.signature = to_hex(make_bytes_view(signature.value()));

  auto record = issued_certificate_t{};
  record.certificate = std::move(certificate);
  record.issued_at = now;
  record.issued_by = certifier_public_key_;
  record.subject = request.subject;
  record.certificate_type = request.certificate_type;
  {
    auto lock = std::scoped_lock{mutex_};
    reserved_serials_.erase(record.certificate.serial_number);
    issued_.insert_or_assign(record.certificate.serial_number, record);
  }
  persist(record);

  spdlog::info("issued {} certificate {} to {}",
               to_string(record.certificate_type),
               record.certificate.serial_number,
               trustgate::common::short_key(record.subject));
  result.issued = std::move(record);
  return result;
}

issuance_result_t certificate_authority::issue_certificate(
    const public_key_t& subject,
    const certificate_type_t type,
    const certificate_claims_t& claims,
    const uint32_t expires_in_days) {
  auto request = certificate_request_t{};
  request.subject = subject;
  request.certificate_type = type;
  request.claims = claims;
  request.expires_in_days = expires_in_days;
  return issue_certificate(request);
}

revocation_result_t certificate_authority::revoke_certificate(
    const std::string& serial_number,
    const std::string& reason,
    const std::optional<public_key_t>& revoked_by) {
  auto result = revocation_result_t{};
  auto record = issued_certificate_t{};
  {
    auto lock = std::scoped_lock{mutex_};
    auto it = issued_.find(serial_number);
    if (it == std::end(issued_)) {
      result.error = trust_error_code::certificate_not_found;
      result.message = "Certificate not found";
      return result;
    }
    if (it->second.revoked) {
      result.revoked = true;
      result.already_revoked = true;
      result.propagated = it->second.revocation_propagated;
      return result;
    }
    it->second.revoked = true;
    it->second.revoked_at = clock_();
    it->second.revoked_by = revoked_by.value_or(certifier_public_key_);
    it->second.revocation_reason = reason;
    it->second.revocation_propagated = ledger_ == nullptr;
    record = it->second;
  }
  persist(record);
  spdlog::info("revoked certificate {}: {}", serial_number, reason);

  result.revoked = true;
  result.propagated = true;
  if (ledger_ != nullptr) {
    result.propagated = publish_revocation(record);
    if (!result.propagated) {
      spdlog::error(
          "revocation of certificate {} is local only; ledger commitment "
          "failed and is queued for retry",
          serial_number);
      auto lock = std::scoped_lock{mutex_};
      pending_revocations_.insert(serial_number);
      result.error = trust_error_code::ledger_unavailable;
      result.message = "Revocation not yet propagated to the ledger";
    }
  }
  return result;
}

bool certificate_authority::publish_revocation(
    const issued_certificate_t& record) {
  auto tx_id = trustgate::common::call_with_deadline(
      "revocation commitment",
      trustgate::common::deadline_for(*ledger_, ledger_timeout_),
      [ledger = ledger_, outpoint = record.certificate.revocation_outpoint,
       commitment = revocation_commitment(record)] {
        return ledger->spend_outpoint(outpoint, make_bytes_view(commitment));
      });
  if (!tx_id) {
    return false;
  }

  auto updated = std::optional<issued_certificate_t>{};
  {
    auto lock = std::scoped_lock{mutex_};
    auto it = issued_.find(record.certificate.serial_number);
    if (it != std::end(issued_)) {
      it->second.revocation_propagated = true;
      updated = it->second;
    }
    pending_revocations_.erase(record.certificate.serial_number);
  }
  if (updated) {
    persist(updated.value());
  }
  spdlog::info("revocation of certificate {} committed in {}",
               record.certificate.serial_number, tx_id.value());
  return true;
}

std::size_t certificate_authority::retry_pending_revocations() {
  if (ledger_ == nullptr) {
    return 0;
  }
  auto pending = std::vector<issued_certificate_t>{};
  {
    auto lock = std::scoped_lock{mutex_};
    for (const auto& serial : pending_revocations_) {
      auto it = issued_.find(serial);
      if (it != std::end(issued_)) {
        pending.push_back(it->second);
      }
    }
  }

  auto published = std::size_t{};
  for (const auto& record : pending) {
    if (publish_revocation(record)) {
      ++published;
    } else {
      spdlog::error("revocation of certificate {} still not propagated",
                    record.certificate.serial_number);
    }
  }
  return published;
}

std::vector<std::string> certificate_authority::pending_revocations() const {
  auto lock = std::scoped_lock{mutex_};
  return {std::begin(pending_revocations_), std::end(pending_revocations_)};
}

certificate_verification_result_t certificate_authority::verify_certificate(
    const certificate_t& certificate) const {
  auto checks = certificate_checks{};
  checks.now = clock_();
  checks.is_trusted = [this](const public_key_t& certifier) {
    return is_trusted_certifier(certifier);
  };
  checks.revocation_reason =
      [this](const certificate_t& cert) -> std::optional<std::string> {
    auto lock = std::scoped_lock{mutex_};
    auto it = issued_.find(cert.serial_number);
    if (it == std::end(issued_) || !it->second.revoked) {
      return std::nullopt;
    }
    return it->second.revocation_reason.value_or("revoked");
  };
  checks.is_revoked = [this](const certificate_t& cert) -> std::optional<bool> {
    if (ledger_ == nullptr) {
      return false;
    }
    return trustgate::common::call_with_deadline(
        "ledger outpoint lookup",
        trustgate::common::deadline_for(*ledger_, ledger_timeout_),
        [ledger = ledger_, outpoint = cert.revocation_outpoint] {
          return ledger->is_outpoint_spent(outpoint);
        });
  };
  checks.verify_signature = [this](const certificate_t& cert) {
    return verify_certificate_signature(signer_, cert, signing_timeout_);
  };
  return run_certificate_checks(certificate, checks);
}

certificate_verification_result_t certificate_authority::has_valid_certificate(
    const public_key_t& public_key) const {
  for (const auto& record : certificates_for_subject(public_key)) {
    auto result = verify_certificate(record.certificate);
    if (result.valid) {
      return result;
    }
  }
  auto result = certificate_verification_result_t{};
  result.error = trust_error_code::certificate_not_found;
  result.message = "No valid certificate found for this public key";
  return result;
}

certificate_verification_result_t certificate_authority::import_certificate(
    const certificate_t& certificate) {
  auto result = verify_certificate(certificate);
  if (!result.valid) {
    spdlog::warn("refused to import certificate {}: {}",
                 certificate.serial_number, result.message);
    return result;
  }

  auto record = issued_certificate_t{};
  record.certificate = certificate;
  auto window = validity_window(certificate);
  record.issued_at =
      window && window->first > 0 ? window->first : clock_();
  record.issued_by = certificate.certifier;
  record.subject = certificate.subject;
  record.certificate_type =
      result.certificate_type.value_or(certificate_type_t::employee);
  {
    auto lock = std::scoped_lock{mutex_};
    issued_.insert_or_assign(certificate.serial_number, record);
  }
  persist(record);
  spdlog::info("imported certificate {} from certifier {}",
               certificate.serial_number,
               trustgate::common::short_key(certificate.certifier));
  return result;
}

std::optional<issued_certificate_t> certificate_authority::find_certificate(
    const std::string& serial_number) const {
  auto lock = std::scoped_lock{mutex_};
  auto it = issued_.find(serial_number);
  if (it == std::end(issued_)) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<issued_certificate_t>
certificate_authority::certificates_for_subject(
    const public_key_t& public_key) const {
  auto lock = std::scoped_lock{mutex_};
  auto out = std::vector<issued_certificate_t>{};
  for (const auto& [serial, record] : issued_) {
    if (record.subject == public_key) {
      out.push_back(record);
    }
  }
  return out;
}

std::vector<issued_certificate_t> certificate_authority::all_certificates()
    const {
  auto lock = std::scoped_lock{mutex_};
  auto out = std::vector<issued_certificate_t>{};
  out.reserve(issued_.size());
  for (const auto& [serial, record] : issued_) {
    out.push_back(record);
  }
  return out;
}

std::vector<issued_certificate_t> certificate_authority::revoked_certificates()
    const {
  auto lock = std::scoped_lock{mutex_};
  auto out = std::vector<issued_certificate_t>{};
  for (const auto& [serial, record] : issued_) {
    if (record.revoked) {
      out.push_back(record);
    }
  }
  return out;
}

std::vector<std::string> certificate_authority::revocation_list() const {
  auto out = std::vector<std::string>{};
  for (const auto& record : revoked_certificates()) {
    out.push_back(record.certificate.serial_number);
  }
  return out;
}

void certificate_authority::add_trusted_certifier(
    const public_key_t& public_key) {
  auto lock = std::scoped_lock{mutex_};
  trusted_certifiers_.insert(public_key);
}

bool certificate_authority::remove_trusted_certifier(
    const public_key_t& public_key) {
  if (public_key == certifier_public_key_) {
    spdlog::warn("refused to remove the authority's own key from the trust set");
    return false;
  }
  auto lock = std::scoped_lock{mutex_};
  trusted_certifiers_.erase(public_key);
  return true;
}

bool certificate_authority::is_trusted_certifier(
    const public_key_t& public_key) const {
  auto lock = std::scoped_lock{mutex_};
  return trusted_certifiers_.contains(public_key);
}

std::vector<public_key_t> certificate_authority::trusted_certifiers() const {
  auto lock = std::scoped_lock{mutex_};
  return {std::begin(trusted_certifiers_), std::end(trusted_certifiers_)};
}

const public_key_t& certificate_authority::certifier_public_key() const {
  return certifier_public_key_;
}

const std::string& certificate_authority::organization_name() const {
  return organization_name_;
}

const std::string& certificate_authority::organization_id() const {
  return organization_id_;
}

void certificate_authority::persist(const issued_certificate_t& record) const {
  if (store_ != nullptr) {
    trustgate::storage::save_issued_certificate(*store_, record);
  }
}

}  // namespace trustgate::identity
