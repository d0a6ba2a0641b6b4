#pragma once

#include <trustgate/schema/primitives.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace trustgate::crypto {

/// Security level plus protocol name. Together with the key id they select
/// the derived key a signature is made with.
struct protocol_id final {
  uint8_t security_level{};
  std::string name;
};

using protocol_id_t = protocol_id;

/// Derive against the caller's own identity key.
struct counterparty_self final {};

/// Derive against the well-known "anyone" key (private key 1). Signatures
/// made this way are verifiable by anyone who knows the signer's identity key;
/// `signer` names that key when verifying someone else's signature.
struct counterparty_anyone final {
  std::optional<trustgate::schema::public_key_t> signer;
};

/// Self, anyone, or a peer identity key (compressed hex).
using counterparty_t = std::variant<counterparty_self,
                                    counterparty_anyone,
                                    trustgate::schema::public_key_t>;

/// Signing primitive consumed by every trust component. Implementations may
/// be a single local key or a remote threshold signer; callers bound every
/// call with a deadline and treat failure as recoverable.
class signing_capability {
 public:
  virtual ~signing_capability() = default;

  /// DER signature over `data`. Throws std::runtime_error when the key
  /// cannot be derived or the signer is unavailable.
  virtual trustgate::schema::bytes_t sign(
      const trustgate::schema::bytes_view_t& data,
      const protocol_id_t& protocol,
      const std::string_view& key_id,
      const counterparty_t& counterparty) const = 0;

  /// For `self` and `anyone`, the signer is this identity unless
  /// `counterparty_anyone::signer` names another key. For a peer key, the
  /// peer is the signer and this identity was its counterparty.
  virtual bool verify(const trustgate::schema::bytes_view_t& data,
                      const trustgate::schema::bytes_view_t& signature,
                      const protocol_id_t& protocol,
                      const std::string_view& key_id,
                      const counterparty_t& counterparty) const = 0;

  virtual trustgate::schema::public_key_t public_key() const = 0;

  /// True when calls never leave the process; they then run without a
  /// deadline thread.
  virtual bool in_process() const noexcept { return false; }
};

/// `<level>-<name>-<key id>`
std::string make_invoice(const protocol_id_t& protocol,
                         const std::string_view& key_id);

}  // namespace trustgate::crypto
