#pragma once

#include <trustgate/common/clock.hpp>
#include <trustgate/crypto/local_signer.hpp>
#include <trustgate/schema/certificate_claims.hpp>
#include <trustgate/schema/primitives.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <system_error>

namespace trustgate::testing {

// 2023-11-14T22:13:20.000Z
inline constexpr auto kStartMs =
    trustgate::schema::timestamp_milliseconds_t{1700000000000};

/// Clock the test moves by hand. Copies share the same time.
class manual_clock final {
 public:
  explicit manual_clock(
      const trustgate::schema::timestamp_milliseconds_t start = kStartMs)
      : now_{std::make_shared<std::atomic<uint64_t>>(start)} {}

  trustgate::common::clock_fn_t fn() const {
    return [now = now_] { return now->load(); };
  }

  trustgate::schema::timestamp_milliseconds_t now() const {
    return now_->load();
  }

  void advance(const uint64_t ms) { now_->fetch_add(ms); }
  void advance_days(const uint64_t days) {
    advance(days * trustgate::common::kMillisecondsPerDay);
  }
  void set(const trustgate::schema::timestamp_milliseconds_t ms) {
    now_->store(ms);
  }

 private:
  std::shared_ptr<std::atomic<uint64_t>> now_;
};

inline std::shared_ptr<trustgate::crypto::local_signer> make_signer() {
  return std::make_shared<trustgate::crypto::local_signer>(
      trustgate::crypto::local_signer::generate());
}

inline trustgate::schema::certificate_request_t make_employee_request(
    const trustgate::schema::public_key_t& subject,
    const uint32_t expires_in_days = 365) {
  auto claims = trustgate::schema::person_claims{};
  claims.name = "Ada Lovelace";
  claims.email = "ada@example.com";
  claims.department = "Engineering";

  auto request = trustgate::schema::certificate_request_t{};
  request.subject = subject;
  request.certificate_type = trustgate::schema::certificate_type_t::employee;
  request.claims = claims;
  request.expires_in_days = expires_in_days;
  return request;
}

inline trustgate::schema::certificate_request_t make_bot_request(
    const trustgate::schema::public_key_t& subject) {
  auto claims = trustgate::schema::agent_claims{};
  claims.name = "build-bot";
  claims.email = "ops@example.com";

  auto request = trustgate::schema::certificate_request_t{};
  request.subject = subject;
  request.certificate_type = trustgate::schema::certificate_type_t::bot;
  request.claims = claims;
  return request;
}

inline std::string make_db_path(const std::string_view prefix) {
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    (std::string{prefix} + "_" +
                     std::to_string(static_cast<unsigned long long>(now)));
  return path.string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

}  // namespace trustgate::testing
