#pragma once

#include <trustgate/schema/primitives.hpp>
#include <trustgate/schema/trust_error_code.hpp>

#include <cstdint>
#include <optional>
#include <string>

// Schema type: auth session.
// Session workflow: nonce-challenge context for one user key. Created
// unverified, verified at most once, absent once expired.
namespace trustgate::schema {

template <uint16_t Version>
struct auth_session;

template <>
struct auth_session<1> final {
  uint16_t version{1};
  std::string session_id;
  public_key_t user_public_key;
  std::string nonce;
  timestamp_milliseconds_t created_at{};
  timestamp_milliseconds_t expires_at{};
  bool verified{};
};

using auth_session_t = auth_session<1>;

struct session_verification_result final {
  bool valid{};
  std::optional<trust_error_code> error;
  std::string message;
  std::optional<auth_session_t> session;
};

using session_verification_result_t = session_verification_result;

struct session_stats final {
  uint64_t total_sessions{};
  uint64_t active_sessions{};
  uint64_t verified_sessions{};
  uint64_t expired_sessions{};
};

using session_stats_t = session_stats;

}  // namespace trustgate::schema
