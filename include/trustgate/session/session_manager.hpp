#pragma once

#include <trustgate/common/clock.hpp>
#include <trustgate/crypto/signing_capability.hpp>
#include <trustgate/schema/auth_session.hpp>

#include <chrono>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace trustgate::session {

inline const auto kSessionProtocol =
    trustgate::crypto::protocol_id_t{2, "agidentity-auth"};

/// `session-<session id>`
std::string session_key_id(const std::string& session_id);

struct session_manager_options final {
  std::chrono::milliseconds session_duration{24 * 60 * 60 * 1000};
  std::chrono::milliseconds timing_anomaly_threshold{500};
  std::chrono::milliseconds sweep_interval{60 * 1000};
  std::chrono::milliseconds signing_timeout{5000};
  bool start_sweeper{true};
};

/// Nonce-challenge authentication and session lifecycle.
///
/// A client proves possession of its key by signing the session nonce with
/// protocol `[2, "agidentity-auth"]`, key id `session-<id>` and this agent's
/// identity key as counterparty. Each session verifies at most once.
class session_manager final {
 public:
  session_manager(
      std::shared_ptr<trustgate::crypto::signing_capability> signer,
      session_manager_options options = {},
      trustgate::common::clock_fn_t clock = trustgate::common::system_clock());
  ~session_manager();

  session_manager(const session_manager&) = delete;
  session_manager& operator=(const session_manager&) = delete;

  trustgate::schema::auth_session_t create_session(
      const trustgate::schema::public_key_t& user_public_key);

  /// Rejects unknown and expired sessions, then clock drift, then a bad
  /// signature over the nonce. A replayed verification of an already
  /// verified session is rejected.
  trustgate::schema::session_verification_result_t verify_session(
      const std::string& session_id,
      const trustgate::schema::bytes_view_t& signature,
      trustgate::schema::timestamp_milliseconds_t client_timestamp);

  /// Extends a verified, unexpired session by the session duration.
  std::optional<trustgate::schema::auth_session_t> refresh_session(
      const std::string& session_id);

  std::optional<trustgate::schema::auth_session_t> get_session(
      const std::string& session_id);
  /// First verified, unexpired session for `user_public_key`.
  std::optional<trustgate::schema::auth_session_t> get_session_by_user(
      const trustgate::schema::public_key_t& user_public_key) const;

  bool invalidate_session(const std::string& session_id);
  std::size_t invalidate_user_sessions(
      const trustgate::schema::public_key_t& user_public_key);

  std::vector<trustgate::schema::auth_session_t> active_sessions() const;
  trustgate::schema::session_stats_t stats() const;

  /// Evicts expired sessions. Returns how many were removed.
  std::size_t sweep();

  /// Cancels the background sweep. Idempotent.
  void stop();

 private:
  /// Describes the anomaly, or std::nullopt when the timestamp is plausible.
  std::optional<std::string> detect_timing_anomaly(
      trustgate::schema::timestamp_milliseconds_t client_timestamp) const;
  void run_sweeper();

  std::shared_ptr<trustgate::crypto::signing_capability> signer_;
  session_manager_options options_;
  trustgate::common::clock_fn_t clock_;

  mutable std::mutex mutex_;
  std::map<std::string, trustgate::schema::auth_session_t, std::less<>>
      sessions_;

  std::mutex sweeper_mutex_;
  std::condition_variable sweeper_cv_;
  bool stopping_{};
  std::thread sweeper_;
};

}  // namespace trustgate::session
