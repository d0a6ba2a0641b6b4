#include <trustgate/common/deadline.hpp>
#include <trustgate/identity/revocation_checker.hpp>

#include <spdlog/spdlog.h>

#include <cstdint>
#include <iterator>
#include <utility>

namespace trustgate::identity {

revocation_subscription::revocation_subscription(std::function<void()> cancel)
    : cancel_{std::move(cancel)} {}

revocation_subscription::~revocation_subscription() {
  cancel();
}

revocation_subscription::revocation_subscription(
    revocation_subscription&& other) noexcept
    : cancel_{std::move(other.cancel_)} {
  other.cancel_ = nullptr;
}

revocation_subscription& revocation_subscription::operator=(
    revocation_subscription&& other) noexcept {
  if (this != &other) {
    cancel();
    cancel_ = std::move(other.cancel_);
    other.cancel_ = nullptr;
  }
  return *this;
}

void revocation_subscription::cancel() {
  if (cancel_) {
    auto cancel = std::move(cancel_);
    cancel_ = nullptr;
    cancel();
  }
}

namespace detail {

struct subscription_table::state final {
  struct entry final {
    trustgate::schema::certificate_t certificate;
    revocation_callback_t callback;
  };

  std::mutex mutex;
  uint64_t next_id{};
  std::map<uint64_t, entry> entries;
};

subscription_table::subscription_table()
    : state_{std::make_shared<state>()} {}

revocation_subscription subscription_table::add(
    const trustgate::schema::certificate_t& cert,
    revocation_callback_t callback) {
  auto lock = std::scoped_lock{state_->mutex};
  auto id = state_->next_id++;
  state_->entries.emplace(id, state::entry{cert, std::move(callback)});
  return revocation_subscription{
      [weak = std::weak_ptr<state>{state_}, id] {
        if (auto locked = weak.lock()) {
          auto inner = std::scoped_lock{locked->mutex};
          locked->entries.erase(id);
        }
      }};
}

void subscription_table::notify(const std::string& serial) {
  auto callbacks = std::vector<revocation_callback_t>{};
  {
    auto lock = std::scoped_lock{state_->mutex};
    for (auto it = std::begin(state_->entries);
         it != std::end(state_->entries);) {
      if (it->second.certificate.serial_number == serial) {
        callbacks.push_back(std::move(it->second.callback));
        it = state_->entries.erase(it);
      } else {
        ++it;
      }
    }
  }
  for (const auto& callback : callbacks) {
    callback(serial);
  }
}

std::vector<trustgate::schema::certificate_t> subscription_table::watched()
    const {
  auto lock = std::scoped_lock{state_->mutex};
  auto out = std::vector<trustgate::schema::certificate_t>{};
  auto seen = std::set<std::string, std::less<>>{};
  for (const auto& [id, entry] : state_->entries) {
    static_cast<void>(id);
    if (seen.insert(entry.certificate.serial_number).second) {
      out.push_back(entry.certificate);
    }
  }
  return out;
}

}  // namespace detail

std::optional<bool> local_revocation_checker::is_revoked(
    const trustgate::schema::certificate_t& certificate) const {
  return contains(certificate.serial_number);
}

revocation_subscription local_revocation_checker::subscribe_to_revocation(
    const trustgate::schema::certificate_t& certificate,
    revocation_callback_t callback) {
  auto subscription = subscriptions_.add(certificate, std::move(callback));
  // A revoke() that landed before add() has already notified; drain here.
  // notify() removes what it fires, so each callback still runs once.
  if (contains(certificate.serial_number)) {
    subscriptions_.notify(certificate.serial_number);
  }
  return subscription;
}

std::map<std::string, bool> local_revocation_checker::batch_check_revocations(
    const std::vector<trustgate::schema::certificate_t>& certificates) const {
  auto lock = std::scoped_lock{mutex_};
  auto out = std::map<std::string, bool>{};
  for (const auto& certificate : certificates) {
    out[certificate.serial_number] =
        revoked_.find(certificate.serial_number) != std::end(revoked_);
  }
  return out;
}

void local_revocation_checker::revoke(const std::string& serial) {
  auto inserted = false;
  {
    auto lock = std::scoped_lock{mutex_};
    inserted = revoked_.insert(serial).second;
  }
  if (inserted) {
    subscriptions_.notify(serial);
  }
}

void local_revocation_checker::sync(const std::vector<std::string>& serials) {
  for (const auto& serial : serials) {
    revoke(serial);
  }
}

bool local_revocation_checker::contains(const std::string& serial) const {
  auto lock = std::scoped_lock{mutex_};
  return revoked_.find(serial) != std::end(revoked_);
}

ledger_revocation_checker::ledger_revocation_checker(
    std::shared_ptr<ledger::ledger_capability> ledger,
    const std::chrono::milliseconds timeout)
    : ledger_{std::move(ledger)}, timeout_{timeout} {}

std::optional<bool> ledger_revocation_checker::is_revoked(
    const trustgate::schema::certificate_t& certificate) const {
  if (!ledger_) {
    return std::nullopt;
  }
  return trustgate::common::call_with_deadline(
      "ledger outpoint lookup",
      trustgate::common::deadline_for(*ledger_, timeout_),
      [ledger = ledger_, outpoint = certificate.revocation_outpoint] {
        return ledger->is_outpoint_spent(outpoint);
      });
}

revocation_subscription ledger_revocation_checker::subscribe_to_revocation(
    const trustgate::schema::certificate_t& certificate,
    revocation_callback_t callback) {
  return subscriptions_.add(certificate, std::move(callback));
}

std::map<std::string, bool> ledger_revocation_checker::batch_check_revocations(
    const std::vector<trustgate::schema::certificate_t>& certificates) const {
  auto out = std::map<std::string, bool>{};
  for (const auto& certificate : certificates) {
    auto revoked = is_revoked(certificate);
    if (revoked.has_value()) {
      out[certificate.serial_number] = revoked.value();
    } else {
      spdlog::warn("revocation status unknown for certificate {}",
                   certificate.serial_number);
    }
  }
  return out;
}

std::size_t ledger_revocation_checker::poll() {
  auto observed = std::size_t{};
  for (const auto& certificate : subscriptions_.watched()) {
    if (is_revoked(certificate).value_or(false)) {
      spdlog::info("revocation outpoint spent for certificate {}",
                   certificate.serial_number);
      subscriptions_.notify(certificate.serial_number);
      ++observed;
    }
  }
  return observed;
}

}  // namespace trustgate::identity
