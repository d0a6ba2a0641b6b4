#pragma once

#include <trustgate/ledger/ledger_capability.hpp>
#include <trustgate/schema/primitives.hpp>

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace trustgate::ledger {

struct ledger_transaction final {
  std::string tx_id;
  uint64_t block_height{};
  trustgate::schema::bytes_t commitment;
  std::optional<std::string> spent_outpoint;
};

using ledger_transaction_t = ledger_transaction;

/// In-process ledger for development and tests. Every transaction is mined
/// into its own block. `set_offline(true)` makes every call throw, which
/// exercises the retry paths.
class local_ledger final : public ledger_capability {
 public:
  std::string publish(
      const trustgate::schema::bytes_view_t& commitment) override;
  std::string spend_outpoint(
      const std::string_view& outpoint,
      const trustgate::schema::bytes_view_t& commitment) override;
  bool is_outpoint_spent(const std::string_view& outpoint) const override;
  bool in_process() const noexcept override { return true; }

  void set_offline(bool offline);
  std::vector<ledger_transaction_t> transactions() const;
  std::optional<ledger_transaction_t> find(const std::string_view& tx_id) const;

 private:
  std::string append(const trustgate::schema::bytes_view_t& commitment,
                     std::optional<std::string> outpoint);
  void throw_if_offline() const;

  mutable std::mutex mutex_;
  std::atomic<bool> offline_{false};
  std::vector<ledger_transaction_t> transactions_;
  std::map<std::string, std::string, std::less<>> spent_;
};

}  // namespace trustgate::ledger
