#pragma once

#include <trustgate/crypto/signing_capability.hpp>
#include <trustgate/schema/primitives.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace trustgate::crypto {

/// True when the linked OpenSSL provides secp256k1.
bool available();

/// secp256k1 signer holding one root key in memory.
///
/// Child keys are derived per (protocol, key id, counterparty): the ECDH
/// point between root key and counterparty, compressed, keys an HMAC-SHA256
/// over the invoice string, and the digest is added to the root key (private
/// side) or to the signer's identity point times G (public side). Signatures
/// are reproducible without storing derived keys.
class local_signer final : public signing_capability {
 public:
  /// `root_private_key` is 32 big-endian bytes in [1, n).
  static std::optional<local_signer> from_private_key(
      const trustgate::schema::bytes_view_t& root_private_key);
  static std::optional<local_signer> from_private_key_hex(
      const std::string_view& hex);
  static local_signer generate();

  trustgate::schema::bytes_t sign(
      const trustgate::schema::bytes_view_t& data,
      const protocol_id_t& protocol,
      const std::string_view& key_id,
      const counterparty_t& counterparty) const override;

  bool verify(const trustgate::schema::bytes_view_t& data,
              const trustgate::schema::bytes_view_t& signature,
              const protocol_id_t& protocol,
              const std::string_view& key_id,
              const counterparty_t& counterparty) const override;

  trustgate::schema::public_key_t public_key() const override;
  bool in_process() const noexcept override { return true; }

  std::string private_key_hex() const;

 private:
  local_signer(trustgate::schema::bytes_t root_private_key,
               trustgate::schema::public_key_t public_key);

  trustgate::schema::bytes_t root_private_key_;
  trustgate::schema::public_key_t public_key_;
};

}  // namespace trustgate::crypto
