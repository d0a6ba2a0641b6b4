#include <trustgate/blake3/hash.hpp>
#include <trustgate/ledger/local_ledger.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <stdexcept>
#include <utility>

namespace trustgate::ledger {

void local_ledger::throw_if_offline() const {
  if (offline_.load()) {
    throw std::runtime_error{"ledger is offline"};
  }
}

std::string local_ledger::append(
    const trustgate::schema::bytes_view_t& commitment,
    std::optional<std::string> outpoint) {
  auto hasher = trustgate::blake3::hasher{};
  hasher.update(commitment);
  hasher.update(fmt::format(":{}", transactions_.size()));
  auto tx = ledger_transaction_t{
      .tx_id = trustgate::schema::to_hex(hasher.finalize()),
      .block_height = transactions_.size() + 1,
      .commitment = trustgate::schema::make_bytes(commitment),
      .spent_outpoint = std::move(outpoint)};
  auto tx_id = tx.tx_id;
  transactions_.push_back(std::move(tx));
  return tx_id;
}

std::string local_ledger::publish(
    const trustgate::schema::bytes_view_t& commitment) {
  throw_if_offline();
  auto lock = std::scoped_lock{mutex_};
  auto tx_id = append(commitment, std::nullopt);
  spdlog::debug("local ledger published {} ({} bytes)", tx_id,
                commitment.size());
  return tx_id;
}

std::string local_ledger::spend_outpoint(
    const std::string_view& outpoint,
    const trustgate::schema::bytes_view_t& commitment) {
  throw_if_offline();
  auto lock = std::scoped_lock{mutex_};
  auto existing = spent_.find(outpoint);
  if (existing != std::end(spent_)) {
    return existing->second;
  }
  auto tx_id = append(commitment, std::string{outpoint});
  spent_.emplace(std::string{outpoint}, tx_id);
  spdlog::debug("local ledger spent outpoint {}", outpoint);
  return tx_id;
}

bool local_ledger::is_outpoint_spent(const std::string_view& outpoint) const {
  throw_if_offline();
  auto lock = std::scoped_lock{mutex_};
  return spent_.find(outpoint) != std::end(spent_);
}

void local_ledger::set_offline(const bool offline) {
  offline_.store(offline);
}

std::vector<ledger_transaction_t> local_ledger::transactions() const {
  auto lock = std::scoped_lock{mutex_};
  return transactions_;
}

std::optional<ledger_transaction_t> local_ledger::find(
    const std::string_view& tx_id) const {
  auto lock = std::scoped_lock{mutex_};
  for (const auto& tx : transactions_) {
    if (tx.tx_id == tx_id) {
      return tx;
    }
  }
  return std::nullopt;
}

}  // namespace trustgate::ledger
