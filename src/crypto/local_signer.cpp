#include <trustgate/crypto/local_signer.hpp>
#include <trustgate/crypto/random.hpp>

#include <openssl/bn.h>
#include <openssl/core_names.h>
#include <openssl/ec.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/obj_mac.h>
#include <openssl/param_build.h>

#include <array>
#include <memory>
#include <optional>
#include <stdexcept>
#include <utility>
#include <variant>
#include <vector>

namespace trustgate::crypto {

namespace {

using evp_pkey_ctx_ptr =
    std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)>;
using evp_pkey_ptr = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;
using evp_md_ctx_ptr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;
using bignum_ptr = std::unique_ptr<BIGNUM, decltype(&BN_clear_free)>;
using bn_ctx_ptr = std::unique_ptr<BN_CTX, decltype(&BN_CTX_free)>;
using ec_group_ptr = std::unique_ptr<EC_GROUP, decltype(&EC_GROUP_free)>;
using ec_point_ptr = std::unique_ptr<EC_POINT, decltype(&EC_POINT_free)>;
using param_bld_ptr =
    std::unique_ptr<OSSL_PARAM_BLD, decltype(&OSSL_PARAM_BLD_free)>;
using ossl_params_ptr = std::unique_ptr<OSSL_PARAM, decltype(&OSSL_PARAM_free)>;

inline constexpr auto kCompressedPointSize = std::size_t{33};
inline constexpr auto kScalarSize = std::size_t{32};

/// Group and scratch space shared by one derivation.
struct curve final {
  ec_group_ptr group{EC_GROUP_new_by_curve_name(NID_secp256k1),
                     EC_GROUP_free};
  bn_ctx_ptr bn{BN_CTX_new(), BN_CTX_free};

  bool ok() const { return group != nullptr && bn != nullptr; }
};

ec_point_ptr new_point(const curve& c) {
  return ec_point_ptr{EC_POINT_new(c.group.get()), EC_POINT_free};
}

bignum_ptr to_bignum(const trustgate::schema::bytes_view_t& bytes) {
  return bignum_ptr{
      BN_bin2bn(bytes.data(), static_cast<int>(bytes.size()), nullptr),
      BN_clear_free};
}

std::optional<ec_point_ptr> decode_point(
    const curve& c,
    const std::string_view& hex) {
  auto bytes = trustgate::schema::try_from_hex(hex);
  if (!bytes || bytes->size() != kCompressedPointSize) {
    return std::nullopt;
  }
  auto point = new_point(c);
  if (!point || EC_POINT_oct2point(c.group.get(), point.get(), bytes->data(),
                                   bytes->size(), c.bn.get()) != 1) {
    return std::nullopt;
  }
  return point;
}

std::optional<trustgate::schema::bytes_t> encode_point(const curve& c,
                                                       const EC_POINT* point) {
  auto out = trustgate::schema::bytes_t(kCompressedPointSize);
  auto written =
      EC_POINT_point2oct(c.group.get(), point, POINT_CONVERSION_COMPRESSED,
                         out.data(), out.size(), c.bn.get());
  if (written != kCompressedPointSize) {
    return std::nullopt;
  }
  return out;
}

std::optional<ec_point_ptr> multiply(const curve& c,
                                     const EC_POINT* point,
                                     const BIGNUM* scalar) {
  auto out = new_point(c);
  if (!out || EC_POINT_mul(c.group.get(), out.get(), nullptr, point, scalar,
                           c.bn.get()) != 1) {
    return std::nullopt;
  }
  return out;
}

std::optional<ec_point_ptr> multiply_generator(const curve& c,
                                               const BIGNUM* scalar) {
  auto out = new_point(c);
  if (!out || EC_POINT_mul(c.group.get(), out.get(), scalar, nullptr, nullptr,
                           c.bn.get()) != 1) {
    return std::nullopt;
  }
  return out;
}

std::optional<trustgate::schema::hash32_t> invoice_digest(
    const trustgate::schema::bytes_t& shared_secret,
    const std::string& invoice) {
  auto digest = trustgate::schema::hash32_t{};
  auto length = 0u;
  if (HMAC(EVP_sha256(), shared_secret.data(),
           static_cast<int>(shared_secret.size()),
           reinterpret_cast<const unsigned char*>(invoice.data()),
           invoice.size(), digest.data(), &length) == nullptr ||
      length != digest.size()) {
    return std::nullopt;
  }
  return digest;
}

std::optional<trustgate::schema::hash32_t> shared_digest(
    const curve& c,
    const EC_POINT* shared_point,
    const protocol_id_t& protocol,
    const std::string_view& key_id) {
  auto shared = encode_point(c, shared_point);
  if (!shared) {
    return std::nullopt;
  }
  return invoice_digest(shared.value(), make_invoice(protocol, key_id));
}

evp_pkey_ptr make_public_pkey(const trustgate::schema::bytes_t& public_key) {
  auto key_ctx = evp_pkey_ctx_ptr{
      EVP_PKEY_CTX_new_from_name(nullptr, "EC", nullptr), EVP_PKEY_CTX_free};
  if (!key_ctx || EVP_PKEY_fromdata_init(key_ctx.get()) != 1) {
    return evp_pkey_ptr{nullptr, EVP_PKEY_free};
  }

  auto* group_name = const_cast<char*>("secp256k1");
  auto params =
      std::array{OSSL_PARAM_construct_utf8_string(OSSL_PKEY_PARAM_GROUP_NAME,
                                                  group_name, 0),
                 OSSL_PARAM_construct_octet_string(
                     OSSL_PKEY_PARAM_PUB_KEY,
                     const_cast<unsigned char*>(public_key.data()),
                     public_key.size()),
                 OSSL_PARAM_construct_end()};

  auto* raw_pkey = static_cast<EVP_PKEY*>(nullptr);
  if (EVP_PKEY_fromdata(key_ctx.get(), &raw_pkey, EVP_PKEY_PUBLIC_KEY,
                        params.data()) != 1) {
    return evp_pkey_ptr{nullptr, EVP_PKEY_free};
  }
  return evp_pkey_ptr{raw_pkey, EVP_PKEY_free};
}

evp_pkey_ptr make_private_pkey(const curve& c, const BIGNUM* private_key) {
  auto failed = evp_pkey_ptr{nullptr, EVP_PKEY_free};
  auto point = multiply_generator(c, private_key);
  if (!point) {
    return failed;
  }
  auto public_key = encode_point(c, point->get());
  if (!public_key) {
    return failed;
  }

  auto builder = param_bld_ptr{OSSL_PARAM_BLD_new(), OSSL_PARAM_BLD_free};
  if (!builder ||
      OSSL_PARAM_BLD_push_utf8_string(
          builder.get(), OSSL_PKEY_PARAM_GROUP_NAME, "secp256k1", 0) != 1 ||
      OSSL_PARAM_BLD_push_BN(builder.get(), OSSL_PKEY_PARAM_PRIV_KEY,
                             private_key) != 1 ||
      OSSL_PARAM_BLD_push_octet_string(builder.get(), OSSL_PKEY_PARAM_PUB_KEY,
                                       public_key->data(),
                                       public_key->size()) != 1) {
    return failed;
  }
  auto params =
      ossl_params_ptr{OSSL_PARAM_BLD_to_param(builder.get()), OSSL_PARAM_free};
  if (!params) {
    return failed;
  }

  auto key_ctx = evp_pkey_ctx_ptr{
      EVP_PKEY_CTX_new_from_name(nullptr, "EC", nullptr), EVP_PKEY_CTX_free};
  if (!key_ctx || EVP_PKEY_fromdata_init(key_ctx.get()) != 1) {
    return failed;
  }
  auto* raw_pkey = static_cast<EVP_PKEY*>(nullptr);
  if (EVP_PKEY_fromdata(key_ctx.get(), &raw_pkey, EVP_PKEY_KEYPAIR,
                        params.get()) != 1) {
    return failed;
  }
  return evp_pkey_ptr{raw_pkey, EVP_PKEY_free};
}

std::optional<trustgate::schema::public_key_t> derive_identity_key(
    const trustgate::schema::bytes_view_t& private_key) {
  auto c = curve{};
  if (!c.ok() || private_key.size() != kScalarSize) {
    return std::nullopt;
  }
  auto scalar = to_bignum(private_key);
  if (!scalar || BN_is_zero(scalar.get()) ||
      BN_cmp(scalar.get(), EC_GROUP_get0_order(c.group.get())) >= 0) {
    return std::nullopt;
  }
  auto point = multiply_generator(c, scalar.get());
  if (!point) {
    return std::nullopt;
  }
  auto encoded = encode_point(c, point->get());
  if (!encoded) {
    return std::nullopt;
  }
  return trustgate::schema::to_hex(
      trustgate::schema::make_bytes_view(encoded.value()));
}

}  // namespace

bool available() {
  static const auto available_now = [] {
    auto c = curve{};
    return c.ok();
  }();
  return available_now;
}

local_signer::local_signer(trustgate::schema::bytes_t root_private_key,
                           trustgate::schema::public_key_t public_key)
    : root_private_key_{std::move(root_private_key)},
      public_key_{std::move(public_key)} {}

std::optional<local_signer> local_signer::from_private_key(
    const trustgate::schema::bytes_view_t& root_private_key) {
  auto public_key = derive_identity_key(root_private_key);
  if (!public_key) {
    return std::nullopt;
  }
  return local_signer{trustgate::schema::make_bytes(root_private_key),
                      std::move(public_key.value())};
}

std::optional<local_signer> local_signer::from_private_key_hex(
    const std::string_view& hex) {
  auto bytes = trustgate::schema::try_from_hex(hex);
  if (!bytes) {
    return std::nullopt;
  }
  return from_private_key(trustgate::schema::make_bytes_view(bytes.value()));
}

local_signer local_signer::generate() {
  while (true) {
    auto candidate = random_bytes(kScalarSize);
    auto signer =
        from_private_key(trustgate::schema::make_bytes_view(candidate));
    if (signer) {
      return std::move(signer.value());
    }
  }
}

trustgate::schema::bytes_t local_signer::sign(
    const trustgate::schema::bytes_view_t& data,
    const protocol_id_t& protocol,
    const std::string_view& key_id,
    const counterparty_t& counterparty) const {
  auto c = curve{};
  if (!c.ok()) {
    throw std::runtime_error{"secp256k1 is not available"};
  }
  auto root = to_bignum(trustgate::schema::make_bytes_view(root_private_key_));
  if (!root) {
    throw std::runtime_error{"failed to load root key"};
  }

  // Point the root key is multiplied with to form the shared secret.
  auto other = std::visit(
      overloaded{[&](const counterparty_self&) {
                   return decode_point(c, public_key_);
                 },
                 [&](const counterparty_anyone&) {
                   auto generator = ec_point_ptr{
                       EC_POINT_dup(EC_GROUP_get0_generator(c.group.get()),
                                    c.group.get()),
                       EC_POINT_free};
                   if (!generator) {
                     return std::optional<ec_point_ptr>{};
                   }
                   return std::optional<ec_point_ptr>{std::move(generator)};
                 },
                 [&](const trustgate::schema::public_key_t& peer) {
                   return decode_point(c, peer);
                 }},
      counterparty);
  if (!other) {
    throw std::runtime_error{"invalid counterparty key"};
  }

  auto shared = multiply(c, other->get(), root.get());
  if (!shared) {
    throw std::runtime_error{"failed to compute shared secret"};
  }
  auto digest = shared_digest(c, shared->get(), protocol, key_id);
  if (!digest) {
    throw std::runtime_error{"failed to derive child key"};
  }

  auto offset = to_bignum(digest.value());
  auto child = bignum_ptr{BN_new(), BN_clear_free};
  if (!offset || !child ||
      BN_mod_add(child.get(), root.get(), offset.get(),
                 EC_GROUP_get0_order(c.group.get()), c.bn.get()) != 1 ||
      BN_is_zero(child.get())) {
    throw std::runtime_error{"failed to derive child key"};
  }

  auto pkey = make_private_pkey(c, child.get());
  if (!pkey) {
    throw std::runtime_error{"failed to load child key"};
  }

  auto ctx = evp_md_ctx_ptr{EVP_MD_CTX_new(), EVP_MD_CTX_free};
  if (!ctx || EVP_DigestSignInit(ctx.get(), nullptr, EVP_sha256(), nullptr,
                                 pkey.get()) != 1) {
    throw std::runtime_error{"failed to initialize signer"};
  }
  auto signature_size = std::size_t{};
  if (EVP_DigestSign(ctx.get(), nullptr, &signature_size, data.data(),
                     data.size()) != 1) {
    throw std::runtime_error{"failed to size signature"};
  }
  auto signature = trustgate::schema::bytes_t(signature_size);
  if (EVP_DigestSign(ctx.get(), signature.data(), &signature_size, data.data(),
                     data.size()) != 1) {
    throw std::runtime_error{"failed to sign"};
  }
  signature.resize(signature_size);
  return signature;
}

bool local_signer::verify(const trustgate::schema::bytes_view_t& data,
                          const trustgate::schema::bytes_view_t& signature,
                          const protocol_id_t& protocol,
                          const std::string_view& key_id,
                          const counterparty_t& counterparty) const {
  if (signature.empty()) {
    return false;
  }
  auto c = curve{};
  if (!c.ok()) {
    return false;
  }
  auto root = to_bignum(trustgate::schema::make_bytes_view(root_private_key_));
  if (!root) {
    return false;
  }

  // Signer identity point and the shared point it derived its child key from.
  auto signer_point = std::optional<ec_point_ptr>{};
  auto shared = std::optional<ec_point_ptr>{};
  std::visit(
      overloaded{[&](const counterparty_self&) {
                   signer_point = decode_point(c, public_key_);
                   if (signer_point) {
                     shared = multiply(c, signer_point->get(), root.get());
                   }
                 },
                 [&](const counterparty_anyone& value) {
                   signer_point =
                       decode_point(c, value.signer.value_or(public_key_));
                   shared = decode_point(c, value.signer.value_or(public_key_));
                 },
                 [&](const trustgate::schema::public_key_t& peer) {
                   signer_point = decode_point(c, peer);
                   if (signer_point) {
                     shared = multiply(c, signer_point->get(), root.get());
                   }
                 }},
      counterparty);
  if (!signer_point || !shared) {
    return false;
  }

  auto digest = shared_digest(c, shared->get(), protocol, key_id);
  if (!digest) {
    return false;
  }
  auto offset = to_bignum(digest.value());
  if (!offset) {
    return false;
  }
  auto offset_point = multiply_generator(c, offset.get());
  auto child = new_point(c);
  if (!offset_point || !child ||
      EC_POINT_add(c.group.get(), child.get(), signer_point->get(),
                   offset_point->get(), c.bn.get()) != 1) {
    return false;
  }
  auto child_key = encode_point(c, child.get());
  if (!child_key) {
    return false;
  }
  auto pkey = make_public_pkey(child_key.value());
  if (!pkey) {
    return false;
  }

  auto ctx = evp_md_ctx_ptr{EVP_MD_CTX_new(), EVP_MD_CTX_free};
  if (!ctx) {
    return false;
  }
  auto ok = false;
  if (EVP_DigestVerifyInit(ctx.get(), nullptr, EVP_sha256(), nullptr,
                           pkey.get()) == 1) {
    ok = EVP_DigestVerify(ctx.get(), signature.data(), signature.size(),
                          data.data(), data.size()) == 1;
  }
  return ok;
}

trustgate::schema::public_key_t local_signer::public_key() const {
  return public_key_;
}

std::string local_signer::private_key_hex() const {
  return trustgate::schema::to_hex(
      trustgate::schema::make_bytes_view(root_private_key_));
}

}  // namespace trustgate::crypto
