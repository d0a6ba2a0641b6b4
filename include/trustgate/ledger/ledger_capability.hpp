#pragma once

#include <trustgate/schema/primitives.hpp>

#include <string>
#include <string_view>

namespace trustgate::ledger {

/// Append-only external ledger used for anchoring and revocation-by-spend.
/// Methods throw std::runtime_error when the ledger cannot be reached;
/// callers bound them with a deadline and treat failure as recoverable.
class ledger_capability {
 public:
  virtual ~ledger_capability() = default;

  /// Publish a zero-value commitment. Returns the transaction id.
  virtual std::string publish(
      const trustgate::schema::bytes_view_t& commitment) = 0;

  /// Spend `outpoint`, attaching `commitment`. Spending an outpoint that is
  /// already spent returns the original transaction id.
  virtual std::string spend_outpoint(
      const std::string_view& outpoint,
      const trustgate::schema::bytes_view_t& commitment) = 0;

  virtual bool is_outpoint_spent(const std::string_view& outpoint) const = 0;

  virtual bool in_process() const noexcept { return false; }
};

}  // namespace trustgate::ledger
