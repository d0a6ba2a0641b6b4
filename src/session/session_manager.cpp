#include <trustgate/common/critical.hpp>
#include <trustgate/common/deadline.hpp>
#include <trustgate/common/format.hpp>
#include <trustgate/crypto/random.hpp>
#include <trustgate/session/session_manager.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <iterator>
#include <utility>

using namespace trustgate::schema;

namespace trustgate::session {

namespace {

inline constexpr auto kSessionIdBytes = std::size_t{32};
inline constexpr auto kNonceBytes = std::size_t{32};
inline constexpr auto kMaxFutureSkew = uint64_t{1000};
inline constexpr auto kMaxTimestampAge = uint64_t{60000};

session_verification_result_t rejection(const trust_error_code code,
                                        std::string message) {
  auto result = session_verification_result_t{};
  result.error = code;
  result.message = std::move(message);
  return result;
}

}  // namespace

std::string session_key_id(const std::string& session_id) {
  return fmt::format("session-{}", session_id);
}

session_manager::session_manager(
    std::shared_ptr<trustgate::crypto::signing_capability> signer,
    session_manager_options options,
    trustgate::common::clock_fn_t clock)
    : signer_{std::move(signer)},
      options_{options},
      clock_{std::move(clock)} {
  if (!signer_) {
    trustgate::common::critical("session manager requires a signer");
  }
  if (options_.start_sweeper) {
    sweeper_ = std::thread{[this] { run_sweeper(); }};
  }
}

session_manager::~session_manager() {
  stop();
}

auth_session_t session_manager::create_session(
    const public_key_t& user_public_key) {
  auto session = auth_session_t{};
  session.session_id = trustgate::crypto::random_hex(kSessionIdBytes);
  session.user_public_key = user_public_key;
  session.nonce = trustgate::crypto::random_hex(kNonceBytes);
  session.created_at = clock_();
  session.expires_at = session.created_at +
                       static_cast<uint64_t>(options_.session_duration.count());
  session.verified = false;

  {
    auto lock = std::scoped_lock{mutex_};
    sessions_.insert_or_assign(session.session_id, session);
  }
  spdlog::debug("created session {} for {}",
                trustgate::common::short_key(session.session_id),
                trustgate::common::short_key(user_public_key));
  return session;
}

session_verification_result_t session_manager::verify_session(
    const std::string& session_id,
    const bytes_view_t& signature,
    const timestamp_milliseconds_t client_timestamp) {
  auto session = auth_session_t{};
  {
    auto lock = std::scoped_lock{mutex_};
    auto it = sessions_.find(session_id);
    if (it == std::end(sessions_)) {
      return rejection(trust_error_code::session_not_found,
                       "Session not found");
    }
    if (clock_() > it->second.expires_at) {
      sessions_.erase(it);
      return rejection(trust_error_code::session_expired, "Session expired");
    }
    if (it->second.verified) {
      spdlog::warn("replayed verification for session {}",
                   trustgate::common::short_key(session_id));
      return rejection(trust_error_code::session_already_verified,
                       "Session already verified");
    }
    session = it->second;
  }

  if (auto anomaly = detect_timing_anomaly(client_timestamp)) {
    spdlog::warn("timing anomaly on session {}: {}",
                 trustgate::common::short_key(session_id), anomaly.value());
    return rejection(trust_error_code::timing_anomaly,
                     fmt::format("Timing anomaly detected: {}",
                                 anomaly.value()));
  }

  auto verified = trustgate::common::call_with_deadline(
      "session signature verification",
      trustgate::common::deadline_for(*signer_, options_.signing_timeout),
      [signer = signer_, nonce = session.nonce,
       signature = bytes_t{std::begin(signature), std::end(signature)},
       key_id = session_key_id(session_id),
       user = session.user_public_key] {
        return signer->verify(make_bytes_view(nonce),
                              make_bytes_view(signature), kSessionProtocol,
                              key_id, trustgate::crypto::counterparty_t{user});
      });
  if (!verified.has_value()) {
    return rejection(trust_error_code::signing_unavailable,
                     "Signature verification unavailable");
  }
  if (!verified.value()) {
    spdlog::warn("invalid nonce signature on session {}",
                 trustgate::common::short_key(session_id));
    return rejection(trust_error_code::invalid_signature, "Invalid signature");
  }

  auto lock = std::scoped_lock{mutex_};
  auto it = sessions_.find(session_id);
  if (it == std::end(sessions_)) {
    return rejection(trust_error_code::session_not_found, "Session not found");
  }
  if (it->second.verified) {
    return rejection(trust_error_code::session_already_verified,
                     "Session already verified");
  }
  it->second.verified = true;

  auto result = session_verification_result_t{};
  result.valid = true;
  result.session = it->second;
  spdlog::info("session {} authenticated for {}",
               trustgate::common::short_key(session_id),
               trustgate::common::short_key(it->second.user_public_key));
  return result;
}

std::optional<std::string> session_manager::detect_timing_anomaly(
    const timestamp_milliseconds_t client_timestamp) const {
  auto server_time = clock_();
  auto drift = server_time > client_timestamp ? server_time - client_timestamp
                                              : client_timestamp - server_time;
  if (drift > static_cast<uint64_t>(options_.timing_anomaly_threshold.count())) {
    return fmt::format("Clock drift too large: {}ms", drift);
  }
  if (client_timestamp > server_time + kMaxFutureSkew) {
    return std::string{"Timestamp in the future"};
  }
  if (client_timestamp + kMaxTimestampAge < server_time) {
    return std::string{"Timestamp too old"};
  }
  return std::nullopt;
}

std::optional<auth_session_t> session_manager::refresh_session(
    const std::string& session_id) {
  auto lock = std::scoped_lock{mutex_};
  auto it = sessions_.find(session_id);
  if (it == std::end(sessions_) || !it->second.verified) {
    return std::nullopt;
  }
  auto now = clock_();
  if (now > it->second.expires_at) {
    sessions_.erase(it);
    return std::nullopt;
  }
  it->second.expires_at =
      now + static_cast<uint64_t>(options_.session_duration.count());
  return it->second;
}

std::optional<auth_session_t> session_manager::get_session(
    const std::string& session_id) {
  auto lock = std::scoped_lock{mutex_};
  auto it = sessions_.find(session_id);
  if (it == std::end(sessions_)) {
    return std::nullopt;
  }
  if (clock_() > it->second.expires_at) {
    sessions_.erase(it);
    return std::nullopt;
  }
  return it->second;
}

std::optional<auth_session_t> session_manager::get_session_by_user(
    const public_key_t& user_public_key) const {
  auto now = clock_();
  auto lock = std::scoped_lock{mutex_};
  for (const auto& [id, session] : sessions_) {
    if (session.user_public_key == user_public_key && session.verified &&
        now <= session.expires_at) {
      return session;
    }
  }
  return std::nullopt;
}

bool session_manager::invalidate_session(const std::string& session_id) {
  auto lock = std::scoped_lock{mutex_};
  return sessions_.erase(session_id) > 0;
}

std::size_t session_manager::invalidate_user_sessions(
    const public_key_t& user_public_key) {
  auto lock = std::scoped_lock{mutex_};
  auto removed = std::erase_if(sessions_, [&](const auto& item) {
    return item.second.user_public_key == user_public_key;
  });
  if (removed > 0) {
    spdlog::info("invalidated {} sessions for {}", removed,
                 trustgate::common::short_key(user_public_key));
  }
  return removed;
}

std::vector<auth_session_t> session_manager::active_sessions() const {
  auto now = clock_();
  auto lock = std::scoped_lock{mutex_};
  auto out = std::vector<auth_session_t>{};
  for (const auto& [id, session] : sessions_) {
    if (session.verified && now <= session.expires_at) {
      out.push_back(session);
    }
  }
  return out;
}

session_stats_t session_manager::stats() const {
  auto now = clock_();
  auto lock = std::scoped_lock{mutex_};
  auto stats = session_stats_t{};
  stats.total_sessions = sessions_.size();
  for (const auto& [id, session] : sessions_) {
    if (now > session.expires_at) {
      ++stats.expired_sessions;
      continue;
    }
    ++stats.active_sessions;
    if (session.verified) {
      ++stats.verified_sessions;
    }
  }
  return stats;
}

std::size_t session_manager::sweep() {
  auto now = clock_();
  auto lock = std::scoped_lock{mutex_};
  auto removed = std::erase_if(sessions_, [now](const auto& item) {
    return now > item.second.expires_at;
  });
  if (removed > 0) {
    spdlog::debug("session sweep evicted {} expired sessions", removed);
  }
  return removed;
}

void session_manager::stop() {
  {
    auto lock = std::scoped_lock{sweeper_mutex_};
    stopping_ = true;
  }
  sweeper_cv_.notify_all();
  if (sweeper_.joinable()) {
    sweeper_.join();
  }
}

void session_manager::run_sweeper() {
  auto lock = std::unique_lock{sweeper_mutex_};
  while (!stopping_) {
    if (sweeper_cv_.wait_for(lock, options_.sweep_interval,
                             [this] { return stopping_; })) {
      break;
    }
    lock.unlock();
    sweep();
    lock.lock();
  }
}

}  // namespace trustgate::session
