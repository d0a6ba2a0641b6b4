#include <trustgate/audit/merkle.hpp>
#include <trustgate/blake3/hash.hpp>

#include <utility>

namespace trustgate::audit {

trustgate::schema::hash_hex_t compute_merkle_root(
    std::vector<trustgate::schema::hash_hex_t> leaves) {
  if (leaves.empty()) {
    return trustgate::schema::make_zero_hash_hex();
  }

  auto level = std::move(leaves);
  while (level.size() > 1) {
    auto next = std::vector<trustgate::schema::hash_hex_t>{};
    next.reserve((level.size() + 1) / 2);
    for (auto i = std::size_t{}; i < level.size(); i += 2) {
      const auto& left = level[i];
      const auto& right = i + 1 < level.size() ? level[i + 1] : level[i];
      next.push_back(trustgate::blake3::hash_hex(left + right));
    }
    level = std::move(next);
  }
  return level.front();
}

}  // namespace trustgate::audit
