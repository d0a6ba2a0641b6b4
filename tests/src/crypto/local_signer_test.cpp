#include <gtest/gtest.h>
#include <trustgate/crypto/local_signer.hpp>
#include <trustgate/crypto/random.hpp>
#include <trustgate/testing/common.hpp>

#include <set>
#include <string>

namespace {

const auto kProtocol = trustgate::crypto::protocol_id_t{2, "test protocol"};

trustgate::schema::bytes_t message() {
  return trustgate::schema::make_bytes(std::string{"approve transfer 42"});
}

}  // namespace

TEST(local_signer, private_key_one_yields_generator_point) {
  if (!trustgate::crypto::available()) {
    GTEST_SKIP() << "secp256k1 not available in this OpenSSL build";
  }
  auto signer = trustgate::crypto::local_signer::from_private_key_hex(
      "0000000000000000000000000000000000000000000000000000000000000001");
  ASSERT_TRUE(signer.has_value());
  EXPECT_EQ(signer->public_key(),
            "0279be667ef9dcbbac55a06295ce870b07029bfcdb2dce28d959f2815b16f81798");
}

TEST(local_signer, rejects_out_of_range_keys) {
  if (!trustgate::crypto::available()) {
    GTEST_SKIP() << "secp256k1 not available in this OpenSSL build";
  }
  EXPECT_FALSE(trustgate::crypto::local_signer::from_private_key_hex(
                   std::string(64, '0'))
                   .has_value());
  EXPECT_FALSE(trustgate::crypto::local_signer::from_private_key_hex(
                   std::string(64, 'f'))
                   .has_value());
  EXPECT_FALSE(
      trustgate::crypto::local_signer::from_private_key_hex("abcd").has_value());
}

TEST(local_signer, private_key_hex_restores_the_same_identity) {
  if (!trustgate::crypto::available()) {
    GTEST_SKIP() << "secp256k1 not available in this OpenSSL build";
  }
  auto signer = trustgate::crypto::local_signer::generate();
  auto restored = trustgate::crypto::local_signer::from_private_key_hex(
      signer.private_key_hex());
  ASSERT_TRUE(restored.has_value());
  EXPECT_EQ(restored->public_key(), signer.public_key());
  EXPECT_EQ(signer.public_key().size(), 66u);
}

TEST(local_signer, anyone_signatures_verify_for_any_holder_of_the_key) {
  if (!trustgate::crypto::available()) {
    GTEST_SKIP() << "secp256k1 not available in this OpenSSL build";
  }
  auto signer = trustgate::testing::make_signer();
  auto verifier = trustgate::testing::make_signer();
  auto data = message();
  auto signature =
      signer->sign(trustgate::schema::make_bytes_view(data), kProtocol,
                   "key-1", trustgate::crypto::counterparty_anyone{});

  EXPECT_TRUE(signer->verify(trustgate::schema::make_bytes_view(data),
                             trustgate::schema::make_bytes_view(signature),
                             kProtocol, "key-1",
                             trustgate::crypto::counterparty_anyone{}));
  EXPECT_TRUE(verifier->verify(
      trustgate::schema::make_bytes_view(data),
      trustgate::schema::make_bytes_view(signature), kProtocol, "key-1",
      trustgate::crypto::counterparty_anyone{signer->public_key()}));
  EXPECT_FALSE(verifier->verify(
      trustgate::schema::make_bytes_view(data),
      trustgate::schema::make_bytes_view(signature), kProtocol, "key-2",
      trustgate::crypto::counterparty_anyone{signer->public_key()}));
  EXPECT_FALSE(verifier->verify(
      trustgate::schema::make_bytes_view(data),
      trustgate::schema::make_bytes_view(signature), kProtocol, "key-1",
      trustgate::crypto::counterparty_anyone{verifier->public_key()}));
}

TEST(local_signer, self_signatures_verify_only_for_the_signer) {
  if (!trustgate::crypto::available()) {
    GTEST_SKIP() << "secp256k1 not available in this OpenSSL build";
  }
  auto signer = trustgate::testing::make_signer();
  auto data = message();
  auto signature =
      signer->sign(trustgate::schema::make_bytes_view(data), kProtocol,
                   "key-1", trustgate::crypto::counterparty_self{});
  EXPECT_TRUE(signer->verify(trustgate::schema::make_bytes_view(data),
                             trustgate::schema::make_bytes_view(signature),
                             kProtocol, "key-1",
                             trustgate::crypto::counterparty_self{}));

  auto tampered = data;
  tampered.back() ^= 0x01;
  EXPECT_FALSE(signer->verify(trustgate::schema::make_bytes_view(tampered),
                              trustgate::schema::make_bytes_view(signature),
                              kProtocol, "key-1",
                              trustgate::crypto::counterparty_self{}));
}

TEST(local_signer, peer_signatures_verify_at_the_counterparty) {
  if (!trustgate::crypto::available()) {
    GTEST_SKIP() << "secp256k1 not available in this OpenSSL build";
  }
  auto user = trustgate::testing::make_signer();
  auto agent = trustgate::testing::make_signer();
  auto stranger = trustgate::testing::make_signer();
  auto data = message();

  auto signature = user->sign(trustgate::schema::make_bytes_view(data),
                              kProtocol, "session-1",
                              trustgate::crypto::counterparty_t{
                                  agent->public_key()});
  EXPECT_TRUE(agent->verify(trustgate::schema::make_bytes_view(data),
                            trustgate::schema::make_bytes_view(signature),
                            kProtocol, "session-1",
                            trustgate::crypto::counterparty_t{
                                user->public_key()}));
  EXPECT_FALSE(stranger->verify(trustgate::schema::make_bytes_view(data),
                                trustgate::schema::make_bytes_view(signature),
                                kProtocol, "session-1",
                                trustgate::crypto::counterparty_t{
                                    user->public_key()}));
}

TEST(local_signer, verify_rejects_malformed_input) {
  if (!trustgate::crypto::available()) {
    GTEST_SKIP() << "secp256k1 not available in this OpenSSL build";
  }
  auto signer = trustgate::testing::make_signer();
  auto data = message();
  auto garbage = trustgate::schema::bytes_t{0x30, 0x01, 0x00};
  EXPECT_FALSE(signer->verify(trustgate::schema::make_bytes_view(data),
                              trustgate::schema::make_bytes_view(garbage),
                              kProtocol, "key-1",
                              trustgate::crypto::counterparty_anyone{}));
  EXPECT_FALSE(signer->verify(
      trustgate::schema::make_bytes_view(data),
      trustgate::schema::make_bytes_view(garbage), kProtocol, "key-1",
      trustgate::crypto::counterparty_t{std::string{"02zz"}}));
}

TEST(random, random_hex_has_requested_length_and_varies) {
  auto seen = std::set<std::string>{};
  for (auto i = 0; i < 64; ++i) {
    auto value = trustgate::crypto::random_hex(16);
    EXPECT_EQ(value.size(), 32u);
    seen.insert(value);
  }
  EXPECT_EQ(seen.size(), 64u);
}

TEST(invoice, names_level_protocol_and_key) {
  EXPECT_EQ(trustgate::crypto::make_invoice(kProtocol, "cert-1"),
            "2-test protocol-cert-1");
}
