#pragma once

#include <trustgate/ledger/ledger_capability.hpp>
#include <trustgate/schema/certificate.hpp>

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace trustgate::identity {

using revocation_callback_t = std::function<void(const std::string& serial)>;

/// Cancels its subscription when destroyed.
class revocation_subscription final {
 public:
  revocation_subscription() = default;
  explicit revocation_subscription(std::function<void()> cancel);
  ~revocation_subscription();

  revocation_subscription(const revocation_subscription&) = delete;
  revocation_subscription& operator=(const revocation_subscription&) = delete;
  revocation_subscription(revocation_subscription&& other) noexcept;
  revocation_subscription& operator=(revocation_subscription&& other) noexcept;

  void cancel();

 private:
  std::function<void()> cancel_;
};

/// Source of truth for whether a certificate has been revoked. Always
/// injected into the verifier so the mechanism can be swapped.
class revocation_checker {
 public:
  virtual ~revocation_checker() = default;

  /// std::nullopt when the revocation source could not be consulted.
  virtual std::optional<bool> is_revoked(
      const trustgate::schema::certificate_t& certificate) const = 0;

  /// `callback` runs once when the certificate is observed as revoked.
  virtual revocation_subscription subscribe_to_revocation(
      const trustgate::schema::certificate_t& certificate,
      revocation_callback_t callback) = 0;

  /// Serial number to revoked flag. Certificates whose status could not be
  /// determined are left out.
  virtual std::map<std::string, bool> batch_check_revocations(
      const std::vector<trustgate::schema::certificate_t>& certificates)
      const = 0;
};

namespace detail {

/// Serial-keyed callback table shared by the checker implementations.
class subscription_table final {
 public:
  subscription_table();

  revocation_subscription add(const trustgate::schema::certificate_t& cert,
                              revocation_callback_t callback);
  /// Fires and removes every callback registered for `serial`.
  void notify(const std::string& serial);
  /// Certificates with at least one live subscription.
  std::vector<trustgate::schema::certificate_t> watched() const;

 private:
  struct state;
  std::shared_ptr<state> state_;
};

}  // namespace detail

/// In-memory revocation list.
class local_revocation_checker final : public revocation_checker {
 public:
  std::optional<bool> is_revoked(
      const trustgate::schema::certificate_t& certificate) const override;
  revocation_subscription subscribe_to_revocation(
      const trustgate::schema::certificate_t& certificate,
      revocation_callback_t callback) override;
  std::map<std::string, bool> batch_check_revocations(
      const std::vector<trustgate::schema::certificate_t>& certificates)
      const override;

  /// Idempotent. Subscribers of a newly revoked serial are notified.
  void revoke(const std::string& serial);
  void sync(const std::vector<std::string>& serials);
  bool contains(const std::string& serial) const;

 private:
  mutable std::mutex mutex_;
  std::set<std::string, std::less<>> revoked_;
  detail::subscription_table subscriptions_;
};

/// Revocation by spend: a certificate is revoked once its revocation
/// outpoint has been spent on the ledger.
class ledger_revocation_checker final : public revocation_checker {
 public:
  ledger_revocation_checker(std::shared_ptr<ledger::ledger_capability> ledger,
                            std::chrono::milliseconds timeout);

  std::optional<bool> is_revoked(
      const trustgate::schema::certificate_t& certificate) const override;
  revocation_subscription subscribe_to_revocation(
      const trustgate::schema::certificate_t& certificate,
      revocation_callback_t callback) override;
  std::map<std::string, bool> batch_check_revocations(
      const std::vector<trustgate::schema::certificate_t>& certificates)
      const override;

  /// Checks every subscribed certificate and notifies those now spent.
  /// Returns the number of revocations observed.
  std::size_t poll();

 private:
  std::shared_ptr<ledger::ledger_capability> ledger_;
  std::chrono::milliseconds timeout_;
  detail::subscription_table subscriptions_;
};

}  // namespace trustgate::identity
