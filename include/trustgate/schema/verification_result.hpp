#pragma once

#include <trustgate/schema/certificate.hpp>
#include <trustgate/schema/certificate_type.hpp>
#include <trustgate/schema/issued_certificate.hpp>
#include <trustgate/schema/trust_error_code.hpp>

#include <optional>
#include <string>

// Schema type: certificate verification result.
// Identity workflow: outcome of the four ordered certificate checks. Routine
// rejections are reported here rather than thrown.
namespace trustgate::schema {

struct certificate_verification_result final {
  bool valid{};
  std::optional<trust_error_code> error;
  std::string message;
  bool revoked{};
  bool expired{};
  bool not_yet_valid{};
  std::optional<certificate_t> certificate;
  std::optional<certificate_type_t> certificate_type;
};

using certificate_verification_result_t = certificate_verification_result;

/// Outcome of `revoke_certificate`. `propagated` is false when the ledger
/// commitment failed and the revocation sits in the retry queue.
struct revocation_result final {
  bool revoked{};
  bool already_revoked{};
  bool propagated{};
  std::optional<trust_error_code> error;
  std::string message;
};

using revocation_result_t = revocation_result;

struct issuance_result final {
  std::optional<issued_certificate_t> issued;
  std::optional<trust_error_code> error;
  std::string message;
};

using issuance_result_t = issuance_result;

}  // namespace trustgate::schema
