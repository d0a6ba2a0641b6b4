#include <gtest/gtest.h>
#include <trustgate/identity/certificate_authority.hpp>
#include <trustgate/identity/identity_gate.hpp>
#include <trustgate/identity/revocation_checker.hpp>
#include <trustgate/ledger/local_ledger.hpp>
#include <trustgate/testing/common.hpp>

#include <fmt/format.h>

#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace {

using trustgate::schema::trust_error_code;

/// CA plus gate sharing one clock; the gate trusts the CA.
struct gate_fixture final {
  explicit gate_fixture(
      std::shared_ptr<trustgate::identity::revocation_checker> checker =
          std::make_shared<trustgate::identity::local_revocation_checker>(),
      std::shared_ptr<trustgate::ledger::ledger_capability> ledger = nullptr,
      const bool require_certificate = true)
      : revocations{std::move(checker)},
        authority{trustgate::testing::make_signer(), authority_options(),
                  clock.fn(), std::move(ledger)},
        gate{trustgate::testing::make_signer(), revocations,
             gate_options(authority.certifier_public_key(),
                          require_certificate),
             clock.fn()} {}

  static trustgate::identity::certificate_authority_options
  authority_options() {
    auto options = trustgate::identity::certificate_authority_options{};
    options.organization_name = "Example Corp";
    options.signing_timeout = std::chrono::milliseconds{0};
    options.ledger_timeout = std::chrono::milliseconds{0};
    return options;
  }

  static trustgate::identity::identity_gate_options gate_options(
      const trustgate::schema::public_key_t& certifier,
      const bool require_certificate) {
    auto options = trustgate::identity::identity_gate_options{};
    options.trusted_certifiers = {certifier};
    options.require_certificate = require_certificate;
    options.signing_timeout = std::chrono::milliseconds{0};
    return options;
  }

  trustgate::schema::certificate_t issue(
      const trustgate::schema::public_key_t& subject) {
    auto result = authority.issue_certificate(
        trustgate::testing::make_employee_request(subject));
    EXPECT_TRUE(result.issued.has_value()) << result.message;
    return result.issued.value_or(trustgate::schema::issued_certificate_t{})
        .certificate;
  }

  trustgate::testing::manual_clock clock;
  std::shared_ptr<trustgate::identity::revocation_checker> revocations;
  trustgate::identity::certificate_authority authority;
  trustgate::identity::identity_gate gate;
};

const auto kSubject = std::string{"02"} + std::string(64, 'a');

}  // namespace

TEST(identity_gate, caches_successful_verifications) {
  if (!trustgate::crypto::available()) {
    GTEST_SKIP() << "secp256k1 not available in this OpenSSL build";
  }
  auto fixture = gate_fixture{};
  auto certificate = fixture.issue(kSubject);

  auto first = fixture.gate.verify_identity(certificate);
  EXPECT_TRUE(first.valid) << first.message;
  EXPECT_EQ(fixture.gate.verifier().cache_size(), 1u);
  EXPECT_TRUE(fixture.gate.verify_identity(certificate).valid);
  EXPECT_EQ(fixture.gate.verifier().cache_size(), 1u);
}

TEST(identity_gate, explicit_revocation_takes_effect_immediately) {
  if (!trustgate::crypto::available()) {
    GTEST_SKIP() << "secp256k1 not available in this OpenSSL build";
  }
  auto fixture = gate_fixture{};
  auto certificate = fixture.issue(kSubject);
  ASSERT_TRUE(fixture.gate.verify_identity(certificate).valid);

  fixture.gate.revoke_certificate(certificate.serial_number, "Left the company");
  auto result = fixture.gate.verify_identity(certificate);
  EXPECT_FALSE(result.valid);
  EXPECT_TRUE(result.revoked);
  EXPECT_EQ(result.error, trust_error_code::certificate_revoked);
  EXPECT_EQ(result.message, "Certificate revoked: Left the company");
  EXPECT_TRUE(
      fixture.gate.verifier().is_locally_revoked(certificate.serial_number));

  fixture.gate.revoke_certificate(certificate.serial_number, "Other reason");
  EXPECT_EQ(fixture.gate.verifier().revocation_list().size(), 1u);
  EXPECT_EQ(fixture.gate.verify_identity(certificate).message,
            "Certificate revoked: Left the company");
}

TEST(identity_gate, cached_results_expire_with_asymmetric_ttl) {
  if (!trustgate::crypto::available()) {
    GTEST_SKIP() << "secp256k1 not available in this OpenSSL build";
  }
  auto checker =
      std::make_shared<trustgate::identity::local_revocation_checker>();
  auto fixture = gate_fixture{checker};
  auto certificate = fixture.issue(kSubject);
  ASSERT_TRUE(fixture.gate.verify_identity(certificate).valid);

  // Revoked at the source without a subscription: the cached success holds
  // until its TTL runs out.
  checker->revoke(certificate.serial_number);
  fixture.clock.advance(59000);
  EXPECT_TRUE(fixture.gate.verify_identity(certificate).valid);
  fixture.clock.advance(1001);
  auto revoked = fixture.gate.verify_identity(certificate);
  EXPECT_TRUE(revoked.revoked);
  EXPECT_EQ(revoked.message, "Certificate has been revoked");
  EXPECT_EQ(fixture.gate.verifier().cache_size(), 1u);

  fixture.clock.advance(10001);
  fixture.gate.verifier().verify(certificate);
  EXPECT_EQ(fixture.gate.verifier().cache_size(), 1u);
}

TEST(identity_gate, subscription_drops_cached_result_on_revocation) {
  if (!trustgate::crypto::available()) {
    GTEST_SKIP() << "secp256k1 not available in this OpenSSL build";
  }
  auto checker =
      std::make_shared<trustgate::identity::local_revocation_checker>();
  auto fixture = gate_fixture{checker};
  auto certificate = fixture.issue(kSubject);
  ASSERT_TRUE(fixture.gate.register_certificate(certificate).valid);
  EXPECT_EQ(fixture.gate.registered_count(), 1u);
  EXPECT_EQ(fixture.gate.subscription_count(), 1u);

  checker->revoke(certificate.serial_number);
  EXPECT_EQ(fixture.gate.verifier().cache_size(), 0u);
  auto result = fixture.gate.verify_by_public_key(kSubject);
  EXPECT_FALSE(result.valid);
  EXPECT_TRUE(result.revoked);
}

TEST(identity_gate, removing_a_certifier_rejects_its_certificates) {
  if (!trustgate::crypto::available()) {
    GTEST_SKIP() << "secp256k1 not available in this OpenSSL build";
  }
  auto fixture = gate_fixture{};
  auto certificate = fixture.issue(kSubject);
  ASSERT_TRUE(fixture.gate.verify_identity(certificate).valid);

  fixture.gate.remove_trusted_certifier(fixture.authority.certifier_public_key());
  EXPECT_EQ(fixture.gate.verifier().cache_size(), 0u);
  auto result = fixture.gate.verify_identity(certificate);
  EXPECT_EQ(result.error, trust_error_code::untrusted_certifier);
  EXPECT_EQ(fixture.gate.verifier().cache_size(), 0u);

  fixture.gate.add_trusted_certifier(fixture.authority.certifier_public_key());
  EXPECT_TRUE(fixture.gate.verify_identity(certificate).valid);
}

TEST(identity_gate, cache_is_not_served_for_a_modified_certificate) {
  if (!trustgate::crypto::available()) {
    GTEST_SKIP() << "secp256k1 not available in this OpenSSL build";
  }
  auto fixture = gate_fixture{};
  auto certificate = fixture.issue(kSubject);
  ASSERT_TRUE(fixture.gate.verify_identity(certificate).valid);

  auto forged = certificate;
  forged.fields["title"] = "Administrator";
  auto result = fixture.gate.verify_identity(forged);
  EXPECT_FALSE(result.valid);
  EXPECT_EQ(result.error, trust_error_code::invalid_signature);
}

TEST(identity_gate, expired_certificate_is_rejected) {
  if (!trustgate::crypto::available()) {
    GTEST_SKIP() << "secp256k1 not available in this OpenSSL build";
  }
  auto fixture = gate_fixture{};
  auto result = fixture.authority.issue_certificate(
      trustgate::testing::make_employee_request(kSubject, 30));
  ASSERT_TRUE(result.issued.has_value());
  auto certificate = result.issued->certificate;
  ASSERT_TRUE(fixture.gate.verify_identity(certificate).valid);

  fixture.clock.advance_days(31);
  auto expired = fixture.gate.verify_identity(certificate);
  EXPECT_TRUE(expired.expired);
  EXPECT_EQ(expired.error, trust_error_code::certificate_expired);
}

TEST(identity_gate, unknown_keys_need_a_registered_certificate) {
  if (!trustgate::crypto::available()) {
    GTEST_SKIP() << "secp256k1 not available in this OpenSSL build";
  }
  auto fixture = gate_fixture{};
  auto missing = fixture.gate.verify_by_public_key(kSubject);
  EXPECT_FALSE(missing.valid);
  EXPECT_EQ(missing.error, trust_error_code::no_certificate_registered);

  auto certificate = fixture.issue(kSubject);
  ASSERT_TRUE(fixture.gate.register_certificate(certificate).valid);
  auto registered = fixture.gate.registered_certificate(kSubject);
  ASSERT_TRUE(registered.has_value());
  EXPECT_EQ(registered->serial_number, certificate.serial_number);
  EXPECT_TRUE(fixture.gate.verify_by_public_key(kSubject).valid);
}

TEST(identity_gate, development_mode_admits_unknown_keys_as_unverified) {
  if (!trustgate::crypto::available()) {
    GTEST_SKIP() << "secp256k1 not available in this OpenSSL build";
  }
  auto fixture = gate_fixture{
      std::make_shared<trustgate::identity::local_revocation_checker>(),
      nullptr, false};
  EXPECT_FALSE(fixture.gate.require_certificate());
  auto result = fixture.gate.verify_by_public_key(kSubject);
  EXPECT_TRUE(result.valid);
  EXPECT_EQ(result.certificate_type,
            trustgate::schema::certificate_type_t::unverified);
}

TEST(identity_gate, gated_operation_runs_only_for_valid_identities) {
  if (!trustgate::crypto::available()) {
    GTEST_SKIP() << "secp256k1 not available in this OpenSSL build";
  }
  auto fixture = gate_fixture{};
  auto certificate = fixture.issue(kSubject);

  auto value = trustgate::identity::gated_operation(
      fixture.gate, certificate, [] { return 42; }, "tool.execute");
  EXPECT_EQ(value, 42);

  fixture.gate.revoke_certificate(certificate.serial_number, "Compromised");
  auto ran = false;
  try {
    trustgate::identity::gated_operation(
        fixture.gate, certificate, [&ran] { ran = true; }, "tool.execute");
    FAIL() << "expected access_denied";
  } catch (const trustgate::identity::access_denied& denied) {
    EXPECT_EQ(denied.operation(), "tool.execute");
    EXPECT_EQ(denied.code(), trust_error_code::certificate_revoked);
    EXPECT_EQ(std::string{denied.what()},
              "[tool.execute] Access denied: Certificate revoked: Compromised");
  }
  EXPECT_FALSE(ran);
}

TEST(identity_gate, gated_operation_by_key_requires_registration) {
  if (!trustgate::crypto::available()) {
    GTEST_SKIP() << "secp256k1 not available in this OpenSSL build";
  }
  auto fixture = gate_fixture{};
  auto ran = false;
  EXPECT_THROW(trustgate::identity::gated_operation_by_key(
                   fixture.gate, kSubject, [&ran] { ran = true; }, "inference"),
               trustgate::identity::access_denied);
  EXPECT_FALSE(ran);

  ASSERT_TRUE(fixture.gate.register_certificate(fixture.issue(kSubject)).valid);
  trustgate::identity::gated_operation_by_key(
      fixture.gate, kSubject, [&ran] { ran = true; }, "inference");
  EXPECT_TRUE(ran);
}

TEST(identity_gate, synced_revocations_unregister_certificates) {
  if (!trustgate::crypto::available()) {
    GTEST_SKIP() << "secp256k1 not available in this OpenSSL build";
  }
  auto fixture = gate_fixture{};
  auto certificate = fixture.issue(kSubject);
  ASSERT_TRUE(fixture.gate.register_certificate(certificate).valid);

  fixture.gate.sync_revocations({certificate.serial_number, "unknown-serial"});
  EXPECT_EQ(fixture.gate.registered_count(), 0u);
  EXPECT_EQ(fixture.gate.verifier().revocation_list().size(), 2u);
  EXPECT_EQ(fixture.gate.verify_identity(certificate).message,
            "Certificate revoked: Synced from revocation list");
}

TEST(identity_gate, ledger_revocations_are_observed_by_refresh) {
  if (!trustgate::crypto::available()) {
    GTEST_SKIP() << "secp256k1 not available in this OpenSSL build";
  }
  auto ledger = std::make_shared<trustgate::ledger::local_ledger>();
  auto checker = std::make_shared<trustgate::identity::ledger_revocation_checker>(
      ledger, std::chrono::milliseconds{0});
  auto fixture = gate_fixture{checker, ledger};
  auto certificate = fixture.issue(kSubject);
  ASSERT_TRUE(fixture.gate.register_certificate(certificate).valid);

  ASSERT_TRUE(fixture.authority
                  .revoke_certificate(certificate.serial_number, "Offboarded")
                  .propagated);
  auto revoked = fixture.gate.refresh_revocations();
  ASSERT_EQ(revoked.size(), 1u);
  EXPECT_EQ(revoked[0], certificate.serial_number);
  EXPECT_EQ(fixture.gate.registered_count(), 0u);
  EXPECT_TRUE(fixture.gate.verify_identity(certificate).revoked);
}

TEST(identity_gate, ledger_poll_invalidates_cached_success) {
  if (!trustgate::crypto::available()) {
    GTEST_SKIP() << "secp256k1 not available in this OpenSSL build";
  }
  auto ledger = std::make_shared<trustgate::ledger::local_ledger>();
  auto checker = std::make_shared<trustgate::identity::ledger_revocation_checker>(
      ledger, std::chrono::milliseconds{0});
  auto fixture = gate_fixture{checker, ledger};
  auto certificate = fixture.issue(kSubject);
  ASSERT_TRUE(fixture.gate.register_certificate(certificate).valid);
  ASSERT_EQ(fixture.gate.verifier().cache_size(), 1u);

  fixture.authority.revoke_certificate(certificate.serial_number, "Offboarded");
  EXPECT_EQ(checker->poll(), 1u);
  EXPECT_EQ(fixture.gate.verifier().cache_size(), 0u);
  EXPECT_TRUE(fixture.gate.verify_by_public_key(kSubject).revoked);
  EXPECT_EQ(checker->poll(), 0u);
}

TEST(identity_gate, unreachable_ledger_is_not_cached) {
  if (!trustgate::crypto::available()) {
    GTEST_SKIP() << "secp256k1 not available in this OpenSSL build";
  }
  auto ledger = std::make_shared<trustgate::ledger::local_ledger>();
  auto checker = std::make_shared<trustgate::identity::ledger_revocation_checker>(
      ledger, std::chrono::milliseconds{0});
  auto fixture = gate_fixture{checker, ledger};
  auto certificate = fixture.issue(kSubject);

  ledger->set_offline(true);
  auto result = fixture.gate.verify_identity(certificate);
  EXPECT_EQ(result.error, trust_error_code::ledger_unavailable);
  EXPECT_EQ(fixture.gate.verifier().cache_size(), 0u);

  ledger->set_offline(false);
  EXPECT_TRUE(fixture.gate.verify_identity(certificate).valid);
}

TEST(identity_gate, revocation_racing_registration_leaves_nothing_behind) {
  if (!trustgate::crypto::available()) {
    GTEST_SKIP() << "secp256k1 not available in this OpenSSL build";
  }
  auto fixture = gate_fixture{};
  for (auto round = 0; round < 50; ++round) {
    auto certificate = fixture.issue(fmt::format("02{:064x}", round + 1));
    ASSERT_TRUE(fixture.gate.verify_identity(certificate).valid);

    auto revoker = std::thread{[&] {
      fixture.gate.revoke_certificate(certificate.serial_number, "Rotated");
    }};
    fixture.gate.register_certificate(certificate);
    revoker.join();

    ASSERT_EQ(fixture.gate.registered_count(), 0u) << "round " << round;
    ASSERT_EQ(fixture.gate.subscription_count(), 0u) << "round " << round;
    EXPECT_FALSE(fixture.gate.verify_identity(certificate).valid);
  }
}
